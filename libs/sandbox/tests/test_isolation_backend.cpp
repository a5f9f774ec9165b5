#include "evoguard/core/error.h"
#include "evoguard/core/logger.h"
#include "evoguard/sandbox/isolation_backend.h"
#include "evoguard/snippet/data_provider.h"
#include "kj/test.h"

#include <kj/debug.h>

using namespace evoguard::sandbox;

namespace {

struct Fixture {
  kj::Own<evoguard::snippet::InMemoryDataProvider> data =
      evoguard::snippet::make_synthetic_ohlcv(120, 9);
  evoguard::core::Logger logger{kj::heap<evoguard::core::TextFormatter>(),
                                kj::heap<evoguard::core::MemoryOutput>()};
};

double metric(const Metrics& metrics, kj::StringPtr name) {
  auto found = metrics.find(name);
  return KJ_ASSERT_NONNULL(found, name);
}

KJ_TEST("ProcessIsolationBackend: Runs the snippet in a child process") {
  Fixture f;
  DirectExecutor executor(*f.data);
  ProcessIsolationBackend backend(executor, {}, f.logger);
  KJ_EXPECT(backend.name() == "process");

  auto report = backend.execute("def strategy(data, params):\n"
                                "    close = data.get('close')\n"
                                "    return close > close.shift(1)\n"
                                "take_profit_pct = 0.3\n"_kj,
                                10000);
  KJ_EXPECT(report.success);
  KJ_EXPECT(metric(report.metrics, "var.take_profit_pct"_kj) == 0.3);
  KJ_EXPECT(report.metrics.find("sharpe_ratio"_kj) != kj::none);

  // Same numbers as running in-process
  auto local = executor.run("def strategy(data, params):\n"
                            "    close = data.get('close')\n"
                            "    return close > close.shift(1)\n"
                            "take_profit_pct = 0.3\n"_kj);
  KJ_EXPECT(metric(report.metrics, "total_return"_kj) ==
            metric(local.metrics, "total_return"_kj));

  auto stats = backend.get_statistics();
  KJ_EXPECT(stats.executions == 1);
  KJ_EXPECT(stats.timeouts == 0);
  KJ_EXPECT(stats.active_contexts == 0);
}

KJ_TEST("ProcessIsolationBackend: Snippet errors come back as a failed report") {
  Fixture f;
  DirectExecutor executor(*f.data);
  ProcessIsolationBackend backend(executor, {}, f.logger);
  auto report = backend.execute("x = undefined_name + 1\n"_kj, 10000);
  KJ_EXPECT(!report.success);
  KJ_EXPECT(report.error != kj::none);
  KJ_EXPECT(backend.get_statistics().failures == 0);
}

KJ_TEST("ProcessIsolationBackend: Deadline kills the child") {
  Fixture f;
  evoguard::snippet::ExecutionLimits limits;
  limits.max_steps = 10'000'000'000ULL;
  DirectExecutor executor(*f.data, {}, limits);
  ProcessIsolationBackend backend(executor, {}, f.logger);

  bool timed_out = false;
  try {
    auto report = backend.execute("while True:\n"
                                  "    x = 1\n"_kj,
                                  200);
  } catch (const evoguard::core::TimeoutException& e) {
    timed_out = true;
    KJ_EXPECT(e.timeout_ms() == 200);
    KJ_EXPECT(e.message().contains("exceeded 200 ms"_kj));
  }
  KJ_EXPECT(timed_out);

  auto stats = backend.get_statistics();
  KJ_EXPECT(stats.timeouts == 1);
  KJ_EXPECT(stats.active_contexts == 0);
}

KJ_TEST("ProcessIsolationBackend: cleanup_all with nothing running") {
  Fixture f;
  DirectExecutor executor(*f.data);
  ProcessIsolationBackend backend(executor, {}, f.logger);
  backend.cleanup_all();
  backend.cleanup_all();
  KJ_EXPECT(backend.get_statistics().active_contexts == 0);
}

KJ_TEST("ProcessIsolationBackend: Report wire form") {
  ExecutionReport report;
  report.success = false;
  report.metrics.insert(kj::str("sharpe_ratio"), -0.25);
  report.metrics.insert(kj::str("trade_count"), 12);
  report.error = kj::str("strategy() failed");

  auto decoded = ProcessIsolationBackend::decode_report(
      ProcessIsolationBackend::encode_report(report));
  KJ_EXPECT(!decoded.success);
  KJ_EXPECT(metric(decoded.metrics, "sharpe_ratio"_kj) == -0.25);
  KJ_EXPECT(metric(decoded.metrics, "trade_count"_kj) == 12);
  KJ_EXPECT(decoded.error != kj::none);

  auto malformed = [](kj::StringPtr text) {
    try {
      auto r = ProcessIsolationBackend::decode_report(text);
    } catch (const evoguard::core::IsolationException& e) {
      KJ_EXPECT(e.message().startsWith("Malformed output"_kj));
      return true;
    }
    return false;
  };
  KJ_EXPECT(malformed(""_kj));
  KJ_EXPECT(malformed("{\"success\": true"_kj));
  KJ_EXPECT(malformed("{\"metrics\": {}}"_kj));
  KJ_EXPECT(malformed("[1, 2]"_kj));
}

} // namespace
