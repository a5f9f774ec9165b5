#include "evoguard/snippet/data_provider.h"
#include "evoguard/snippet/interpreter.h"
#include "evoguard/snippet/parser.h"
#include "kj/test.h"

#include <cmath>
#include <kj/debug.h>

using namespace evoguard::snippet;

namespace {

kj::Own<InMemoryDataProvider> small_data() {
  auto data = kj::heap<InMemoryDataProvider>();
  data->set_column("close"_kj, kj::heapArray<double>({10.0, 11.0, 12.0, 11.0, 13.0}));
  data->set_column("volume"_kj, kj::heapArray<double>({100.0, 200.0, 300.0, 400.0, 500.0}));
  return data;
}

struct Run {
  Module module;
  kj::Own<InMemoryDataProvider> data;
  ParamMap params;
  kj::Own<Interpreter> interpreter;

  explicit Run(kj::StringPtr source, ExecutionLimits limits = {})
      : module(parse_or_throw(source)), data(small_data()) {
    params.insert(kj::str("lookback"), 2.0);
    interpreter = kj::heap<Interpreter>(module, *data, params, limits);
    interpreter->run();
  }

  double number(kj::StringPtr name) const {
    auto value = interpreter->global(name);
    auto& v = KJ_ASSERT_NONNULL(value, name);
    KJ_ASSERT(v.is_numeric(), name, v.type_name());
    return v.as_number();
  }

  kj::ArrayPtr<const double> series(kj::StringPtr name) const {
    auto value = interpreter->global(name);
    auto& v = KJ_ASSERT_NONNULL(value, name);
    KJ_ASSERT(v.is(Value::Kind::Series), name, v.type_name());
    return v.as_series();
  }
};

kj::Maybe<kj::String> execution_error(kj::StringPtr source, ExecutionLimits limits = {}) {
  try {
    Run run(source, limits);
  } catch (const ExecutionError& e) {
    return kj::str(e.message());
  }
  return kj::none;
}

KJ_TEST("Interpreter: Arithmetic follows Python semantics") {
  Run run("a = 7 // 2\n"
          "b = -7 // 2\n"
          "c = 7 % 3\n"
          "d = -7 % 3\n"
          "e = 2 ** 10\n"
          "f = 7 / 2\n"
          "g = 1 if 3 > 2 else 0\n"_kj);
  KJ_EXPECT(run.number("a"_kj) == 3);
  KJ_EXPECT(run.number("b"_kj) == -4);
  KJ_EXPECT(run.number("c"_kj) == 1);
  KJ_EXPECT(run.number("d"_kj) == 2);
  KJ_EXPECT(run.number("e"_kj) == 1024);
  KJ_EXPECT(run.number("f"_kj) == 3.5);
  KJ_EXPECT(run.number("g"_kj) == 1);
}

KJ_TEST("Interpreter: Built-in functions") {
  Run run("a = abs(-3)\n"
          "b = min(4, 2, 9)\n"
          "c = max([1, 5, 3])\n"
          "d = len([1, 2, 3])\n"
          "e = float('2.5')\n"
          "f = int(3.9)\n"
          "g = bool(0)\n"
          "h = 0\n"
          "for i in range(1, 5):\n"
          "    h += i\n"_kj);
  KJ_EXPECT(run.number("a"_kj) == 3);
  KJ_EXPECT(run.number("b"_kj) == 2);
  KJ_EXPECT(run.number("c"_kj) == 5);
  KJ_EXPECT(run.number("d"_kj) == 3);
  KJ_EXPECT(run.number("e"_kj) == 2.5);
  KJ_EXPECT(run.number("f"_kj) == 3);
  KJ_EXPECT(run.number("g"_kj) == 0);
  KJ_EXPECT(run.number("h"_kj) == 10);
}

KJ_TEST("Interpreter: Data and params access") {
  Run run("close = data.get('close')\n"
          "vol = data['volume']\n"
          "n = params['lookback']\n"
          "m = params.get('missing', 7)\n"
          "bars = len(close)\n"_kj);
  KJ_EXPECT(run.series("close"_kj).size() == 5);
  KJ_EXPECT(run.series("vol"_kj)[4] == 500.0);
  KJ_EXPECT(run.number("n"_kj) == 2);
  KJ_EXPECT(run.number("m"_kj) == 7);
  KJ_EXPECT(run.number("bars"_kj) == 5);
}

KJ_TEST("Interpreter: Series methods") {
  Run run("close = data.get('close')\n"
          "shifted = close.shift(1)\n"
          "diffed = close.diff(1)\n"
          "ma = close.rolling(2).mean()\n"
          "hi = close.rolling(3).max()\n"
          "filled = shifted.fillna(0)\n"
          "avg = close.mean()\n"
          "top = close.max()\n"
          "last = close.last()\n"
          "change = close.pct_change(1)\n"_kj);
  auto shifted = run.series("shifted"_kj);
  KJ_EXPECT(std::isnan(shifted[0]));
  KJ_EXPECT(shifted[1] == 10.0);

  KJ_EXPECT(run.series("diffed"_kj)[2] == 1.0);

  auto ma = run.series("ma"_kj);
  KJ_EXPECT(std::isnan(ma[0]));
  KJ_EXPECT(ma[1] == 10.5);
  KJ_EXPECT(ma[4] == 12.0);

  auto hi = run.series("hi"_kj);
  KJ_EXPECT(std::isnan(hi[1]));
  KJ_EXPECT(hi[2] == 12.0);

  KJ_EXPECT(run.series("filled"_kj)[0] == 0.0);
  KJ_EXPECT(run.number("avg"_kj) == 11.4);
  KJ_EXPECT(run.number("top"_kj) == 13.0);
  KJ_EXPECT(run.number("last"_kj) == 13.0);
  KJ_EXPECT(std::abs(run.series("change"_kj)[1] - 0.1) < 1e-12);
}

KJ_TEST("Interpreter: Series arithmetic and comparison are elementwise") {
  Run run("close = data.get('close')\n"
          "up = close > close.shift(1)\n"
          "scaled = close * 2 - 1\n"
          "both = (close > 10) & (close < 13)\n"_kj);
  auto up = run.series("up"_kj);
  KJ_EXPECT(up[1] == 1.0);
  KJ_EXPECT(up[3] == 0.0);
  KJ_EXPECT(run.series("scaled"_kj)[0] == 19.0);
  auto both = run.series("both"_kj);
  KJ_EXPECT(both[0] == 0.0);
  KJ_EXPECT(both[1] == 1.0);
  KJ_EXPECT(both[4] == 0.0);
}

KJ_TEST("Interpreter: Functions with defaults and keywords") {
  Run run("def scale(x, factor=2):\n"
          "    return x * factor\n"
          "a = scale(3)\n"
          "b = scale(3, factor=5)\n"_kj);
  KJ_EXPECT(run.number("a"_kj) == 6);
  KJ_EXPECT(run.number("b"_kj) == 15);
}

KJ_TEST("Interpreter: call invokes a module function") {
  Run run("def strategy(data, params):\n"
          "    close = data.get('close')\n"
          "    return close > close.rolling(params['lookback']).mean()\n"_kj);
  Value args[] = {Value::data(), Value::params()};
  auto result = run.interpreter->call("strategy"_kj, kj::arrayPtr(args, 2));
  KJ_ASSERT(result.is(Value::Kind::Series));
  KJ_EXPECT(result.as_series().size() == 5);
  KJ_EXPECT(result.as_series()[1] == 1.0);
}

KJ_TEST("Interpreter: Step budget bounds execution") {
  ExecutionLimits limits;
  limits.max_steps = 1000;
  auto error = execution_error("x = 0\n"
                               "while True:\n"
                               "    x += 1\n"_kj,
                               limits);
  KJ_IF_SOME(message, error) {
    KJ_EXPECT(message.contains("step budget exceeded"_kj), message);
  }
  else {
    KJ_FAIL_EXPECT("infinite loop should exhaust the step budget");
  }
}

KJ_TEST("Interpreter: Recursion depth is bounded") {
  auto error = execution_error("def f(n):\n"
                               "    return f(n + 1)\n"
                               "x = f(0)\n"_kj);
  KJ_IF_SOME(message, error) {
    KJ_EXPECT(message.contains("maximum recursion depth exceeded"_kj), message);
  }
  else {
    KJ_FAIL_EXPECT("unbounded recursion should fail");
  }
}

KJ_TEST("Interpreter: Runtime errors carry the snippet line") {
  try {
    Run run("x = 1\n"
            "y = undefined_name\n"_kj);
    KJ_FAIL_EXPECT("unknown name should fail");
  } catch (const ExecutionError& e) {
    KJ_EXPECT(e.snippet_line() == 2);
    KJ_EXPECT(e.message().contains("is not defined"_kj));
  }

  KJ_EXPECT(execution_error("x = data['open_interest']\n"_kj) != kj::none);
  KJ_EXPECT(execution_error("x = 1 / 0\n"_kj) != kj::none);
  KJ_EXPECT(execution_error("import os\n"_kj) != kj::none);
}

KJ_TEST("DataProvider: Synthetic OHLCV is deterministic") {
  auto a = make_synthetic_ohlcv(50, 9);
  auto b = make_synthetic_ohlcv(50, 9);
  KJ_EXPECT(a->length() == 50);

  auto column_a = a->column("close"_kj);
  auto column_b = b->column("close"_kj);
  auto close_a = KJ_ASSERT_NONNULL(column_a);
  auto close_b = KJ_ASSERT_NONNULL(column_b);
  for (size_t i = 0; i < close_a.size(); ++i) {
    KJ_EXPECT(close_a[i] == close_b[i]);
    KJ_EXPECT(close_a[i] > 0.0);
  }
  KJ_EXPECT(a->column("high"_kj) != kj::none);
  KJ_EXPECT(a->column("volume"_kj) != kj::none);
  KJ_EXPECT(a->column("sentiment"_kj) == kj::none);
}

} // namespace
