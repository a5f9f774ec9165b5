#include "evoguard/sandbox/direct_executor.h"

#include "evoguard/core/error.h"
#include "evoguard/snippet/parser.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::sandbox {

namespace {

void put_metric(Metrics& metrics, kj::StringPtr key, double value) {
  metrics.upsert(kj::str(key), value, [](double& existing, double&& replacement) {
    existing = replacement;
  });
}

kj::Maybe<double> numeric_global(const snippet::Interpreter& interpreter, kj::StringPtr name) {
  KJ_IF_SOME(value, interpreter.global(name)) {
    if (value.is_numeric()) {
      return value.as_number();
    }
  }
  return kj::none;
}

kj::Array<double> signal_from(const snippet::Value& value, size_t length) {
  if (value.is(snippet::Value::Kind::Series)) {
    auto series = value.as_series();
    if (series.size() != length) {
      throw snippet::ExecutionError(kj::str("strategy() returned ", series.size(),
                                            " values for ", length, " bars"));
    }
    return kj::heapArray<double>(series);
  }
  if (value.is_numeric()) {
    auto signal = kj::heapArray<double>(length);
    for (auto& v : signal) {
      v = value.as_number();
    }
    return signal;
  }
  throw snippet::ExecutionError(
      kj::str("strategy() must return a series or a number, got ", value.type_name()));
}

} // namespace

Metrics clone_metrics(const Metrics& metrics) {
  Metrics copy;
  for (auto& entry : metrics) {
    copy.insert(kj::str(entry.key), entry.value);
  }
  return copy;
}

ExecutionReport ExecutionReport::clone() const {
  ExecutionReport copy;
  copy.success = success;
  copy.metrics = clone_metrics(metrics);
  KJ_IF_SOME(e, error) {
    copy.error = kj::str(e);
  }
  return copy;
}

DirectExecutor::DirectExecutor(const snippet::DataProvider& data, snippet::ParamMap params,
                               snippet::ExecutionLimits limits)
    : data_(data), params_(kj::mv(params)), limits_(limits) {}

ExitRules DirectExecutor::read_exit_rules(const snippet::Interpreter& interpreter) {
  ExitRules rules;
  KJ_IF_SOME(v, numeric_global(interpreter, "stop_loss_pct"_kj)) {
    rules.stop_loss_pct = v;
  }
  KJ_IF_SOME(v, numeric_global(interpreter, "take_profit_pct"_kj)) {
    rules.take_profit_pct = v;
  }
  KJ_IF_SOME(v, numeric_global(interpreter, "trailing_stop_offset"_kj)) {
    rules.trailing_stop_offset = v;
  }
  KJ_IF_SOME(v, numeric_global(interpreter, "holding_period_days"_kj)) {
    rules.holding_period_days = static_cast<int>(std::lround(v));
  }
  return rules;
}

Metrics DirectExecutor::execute(kj::StringPtr code) const {
  auto module = snippet::parse_or_throw(code);
  snippet::Interpreter interpreter(module, data_, params_, limits_);
  interpreter.run();

  Metrics metrics;
  KJ_IF_SOME(fn, interpreter.global("strategy"_kj)) {
    if (fn.is(snippet::Value::Kind::Function)) {
      snippet::Value args[] = {snippet::Value::data(), snippet::Value::params()};
      auto result = interpreter.call("strategy"_kj, kj::arrayPtr(args, 2));

      auto column = data_.column("close"_kj);
      auto close = KJ_UNWRAP_OR(column, {
        throw snippet::ExecutionError("data has no 'close' column"_kj);
      });
      auto signal = signal_from(result, close.size());
      auto bt = run_signal_backtest(close, signal, read_exit_rules(interpreter));
      put_metric(metrics, "total_return"_kj, bt.total_return);
      put_metric(metrics, "annual_return"_kj, bt.annual_return);
      put_metric(metrics, "sharpe_ratio"_kj, bt.sharpe_ratio);
      put_metric(metrics, "max_drawdown"_kj, bt.max_drawdown);
      put_metric(metrics, "win_rate"_kj, bt.win_rate);
      put_metric(metrics, "trade_count"_kj, bt.trade_count);
      put_metric(metrics, "exposure"_kj, bt.exposure);
    }
  }

  for (auto name : interpreter.global_names()) {
    KJ_IF_SOME(v, numeric_global(interpreter, name)) {
      if (std::isfinite(v)) {
        put_metric(metrics, kj::str("var.", name), v);
      }
    }
  }
  put_metric(metrics, "steps"_kj, static_cast<double>(interpreter.steps_used()));
  return metrics;
}

ExecutionReport DirectExecutor::run(kj::StringPtr code) const {
  ExecutionReport report;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               try {
                 report.metrics = execute(code);
                 report.success = true;
               } catch (const core::EvoGuardException& e) {
                 report.error = kj::str(e.message());
               }
             })) {
    report.error = kj::str(exception.getDescription());
  }
  return report;
}

} // namespace evoguard::sandbox
