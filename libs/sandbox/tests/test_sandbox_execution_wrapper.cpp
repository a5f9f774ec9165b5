#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/core/logger.h"
#include "evoguard/sandbox/sandbox_execution_wrapper.h"
#include "evoguard/snippet/data_provider.h"
#include "kj/test.h"

#include <kj/debug.h>

using namespace evoguard::sandbox;

namespace {

constexpr kj::StringPtr kSnippet = "def strategy(data, params):\n"
                                   "    close = data.get('close')\n"
                                   "    return close > close.shift(1)\n"
                                   "stop_loss_pct = 0.08\n"_kj;

struct BackendLog {
  int executions = 0;
  int cleanups = 0;
};

enum class Behavior { Succeed, Throw, Timeout };

/// Backend double; records calls in a log owned by the test
class FakeBackend final : public IsolationBackend {
public:
  FakeBackend(Behavior behavior, BackendLog& log) : behavior_(behavior), log_(log) {}

  kj::StringPtr name() const override {
    return "fake"_kj;
  }

  ExecutionReport execute(kj::StringPtr code, int64_t timeout_ms) override {
    ++log_.executions;
    switch (behavior_) {
    case Behavior::Succeed: {
      ExecutionReport report;
      report.success = true;
      report.metrics.insert(kj::str("sharpe_ratio"), 9.0);
      return report;
    }
    case Behavior::Throw:
      throw evoguard::core::IsolationException("container runtime unavailable"_kj);
    case Behavior::Timeout:
      throw evoguard::core::TimeoutException("deadline passed"_kj, timeout_ms);
    }
    KJ_UNREACHABLE;
  }

  void cleanup_all() override {
    ++log_.cleanups;
  }

private:
  Behavior behavior_;
  BackendLog& log_;
};

struct Fixture {
  kj::Own<evoguard::snippet::InMemoryDataProvider> data =
      evoguard::snippet::make_synthetic_ohlcv(120, 2);
  DirectExecutor direct{*data};
  kj::Own<evoguard::core::MemoryOutput> output_owner = kj::heap<evoguard::core::MemoryOutput>();
  evoguard::core::MemoryOutput& output = *output_owner;
  evoguard::core::Logger logger{kj::heap<evoguard::core::TextFormatter>(), kj::mv(output_owner)};
  BackendLog log;

  kj::Own<SandboxExecutionWrapper> make(ExecutionMode mode, Behavior behavior) {
    SandboxConfig config;
    config.mode = mode;
    return kj::heap<SandboxExecutionWrapper>(config, direct,
                                             kj::heap<FakeBackend>(behavior, log), logger);
  }
};

double metric(const Metrics& metrics, kj::StringPtr name) {
  auto found = metrics.find(name);
  return KJ_ASSERT_NONNULL(found, name);
}

KJ_TEST("SandboxExecutionWrapper: Isolated success uses the backend") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Succeed);
  auto outcome = wrapper->execute(kSnippet);

  KJ_EXPECT(outcome.success);
  KJ_EXPECT(outcome.isolated);
  KJ_EXPECT(metric(outcome.metrics, "sharpe_ratio"_kj) == 9.0);
  KJ_EXPECT(f.log.executions == 1);
  KJ_EXPECT(wrapper->last_isolation_result() == IsolationResult::Succeeded);
  KJ_EXPECT(wrapper->get_statistics().fallback_count == 0);
}

KJ_TEST("SandboxExecutionWrapper: Backend failure falls back to direct execution") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Throw);

  auto outcome = wrapper->execute(kSnippet);
  KJ_EXPECT(outcome.success);
  KJ_EXPECT(!outcome.isolated);
  KJ_EXPECT(metric(outcome.metrics, "var.stop_loss_pct"_kj) == 0.08);
  KJ_EXPECT(outcome.metrics.find("sharpe_ratio"_kj) != kj::none);

  auto stats = wrapper->get_statistics();
  KJ_EXPECT(stats.execution_count == 1);
  KJ_EXPECT(stats.fallback_count == 1);
  KJ_EXPECT(stats.last_isolation_result == IsolationResult::Failed);
  KJ_EXPECT(f.log.executions == 1);
  KJ_EXPECT(f.output.contains("falling back to direct execution"_kj));
  KJ_EXPECT(f.output.contains("[WARN]"_kj));
}

KJ_TEST("SandboxExecutionWrapper: Timeout falls back to direct execution") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Timeout);
  auto outcome = wrapper->execute(kSnippet, 50);
  KJ_EXPECT(outcome.success);
  KJ_EXPECT(!outcome.isolated);
  KJ_EXPECT(wrapper->last_isolation_result() == IsolationResult::Failed);
  KJ_EXPECT(f.output.contains("timed out after 50ms"_kj));
}

KJ_TEST("SandboxExecutionWrapper: Direct mode never touches the backend") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Direct, Behavior::Throw);
  for (int i = 0; i < 3; ++i) {
    auto outcome = wrapper->execute(kSnippet);
    KJ_EXPECT(outcome.success);
    KJ_EXPECT(!outcome.isolated);
  }
  KJ_EXPECT(f.log.executions == 0);
  auto stats = wrapper->get_statistics();
  KJ_EXPECT(stats.execution_count == 3);
  KJ_EXPECT(stats.fallback_count == 0);
  KJ_EXPECT(stats.last_isolation_result == IsolationResult::Unknown);
  KJ_EXPECT(wrapper->mode() == ExecutionMode::Direct);
}

KJ_TEST("SandboxExecutionWrapper: Snippet errors surface only when direct execution fails too") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Throw);
  auto outcome = wrapper->execute("x = data['open_interest']\n"_kj);
  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(outcome.error != kj::none);
  KJ_EXPECT(wrapper->get_statistics().fallback_count == 1);
}

KJ_TEST("SandboxExecutionWrapper: Statistics accumulate") {
  Fixture f;
  auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Throw);
  for (int i = 0; i < 4; ++i) {
    auto outcome = wrapper->execute(kSnippet);
  }
  auto stats = wrapper->get_statistics();
  KJ_EXPECT(stats.execution_count == 4);
  KJ_EXPECT(stats.fallback_count == 4);
  KJ_EXPECT(stats.fallback_rate() == 1.0);

  auto doc = evoguard::core::JsonDocument::parse(stats.to_json());
  KJ_EXPECT(doc.root()["execution_count"_kj].get_int() == 4);
  KJ_EXPECT(doc.root()["last_isolation_result"_kj].get_string() == "failed");
}

KJ_TEST("SandboxExecutionWrapper: Shutdown cleans up once") {
  Fixture f;
  {
    auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Succeed);
    wrapper->shutdown();
    wrapper->shutdown();
    KJ_EXPECT(f.log.cleanups == 1);
  }
  KJ_EXPECT(f.log.cleanups == 1);

  {
    auto wrapper = f.make(ExecutionMode::Isolated, Behavior::Succeed);
  }
  KJ_EXPECT(f.log.cleanups == 2);
}

KJ_TEST("SandboxExecutionWrapper: Isolated mode requires a backend") {
  Fixture f;
  SandboxConfig config;
  config.mode = ExecutionMode::Isolated;
  bool caught = false;
  try {
    SandboxExecutionWrapper wrapper(config, f.direct, kj::none, f.logger);
  } catch (const evoguard::core::ConfigException& e) {
    caught = true;
    KJ_EXPECT(e.message().contains("requires an isolation backend"_kj));
  }
  KJ_EXPECT(caught);

  config.mode = ExecutionMode::Direct;
  SandboxExecutionWrapper direct_only(config, f.direct, kj::none, f.logger);
  KJ_EXPECT(direct_only.execute(kSnippet).success);
}

KJ_TEST("SandboxConfig: JSON section and validation") {
  auto config = SandboxConfig::from_json(
      R"({"sandbox": {"mode": "direct", "timeout_ms": 5000, "memory_limit_mb": 256}})"_kj);
  KJ_EXPECT(config.mode == ExecutionMode::Direct);
  KJ_EXPECT(config.timeout_ms == 5000);
  KJ_EXPECT(config.memory_limit_mb == 256);
  KJ_EXPECT(config.cpu_limit_seconds == 60);

  auto defaults = SandboxConfig::from_json("{}"_kj);
  KJ_EXPECT(defaults.mode == ExecutionMode::Isolated);
  KJ_EXPECT(defaults.timeout_ms == 120000);

  KJ_EXPECT(parse_execution_mode("isolated"_kj) == ExecutionMode::Isolated);
  KJ_EXPECT(to_string(ExecutionMode::Direct) == "direct");

  auto rejected = [](kj::StringPtr json) {
    try {
      auto c = SandboxConfig::from_json(json);
    } catch (const evoguard::core::ConfigException&) {
      return true;
    }
    return false;
  };
  KJ_EXPECT(rejected(R"({"sandbox": {"mode": "docker"}})"_kj));
  KJ_EXPECT(rejected(R"({"sandbox": {"timeout_ms": 0}})"_kj));
  KJ_EXPECT(rejected(R"({"sandbox": {"timeout_ms": 1.5}})"_kj));
  KJ_EXPECT(rejected(R"({"sandbox": []})"_kj));
  KJ_EXPECT(rejected("{oops"_kj));
}

} // namespace
