#include "evoguard/sandbox/sandbox_execution_wrapper.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"

#include <kj/debug.h>

namespace evoguard::sandbox {

kj::StringPtr to_string(IsolationResult result) {
  switch (result) {
  case IsolationResult::Unknown:
    return "unknown"_kj;
  case IsolationResult::Succeeded:
    return "succeeded"_kj;
  case IsolationResult::Failed:
    return "failed"_kj;
  }
  KJ_UNREACHABLE;
}

kj::String SandboxStatistics::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put("execution_count", execution_count);
  builder.put("fallback_count", fallback_count);
  builder.put("fallback_rate", fallback_rate());
  builder.put("last_isolation_result", to_string(last_isolation_result));
  return builder.build(pretty);
}

SandboxExecutionWrapper::SandboxExecutionWrapper(const SandboxConfig& config,
                                                 const DirectExecutor& direct,
                                                 kj::Maybe<kj::Own<IsolationBackend>> backend,
                                                 core::Logger& logger)
    : config_(config), direct_(direct), backend_(kj::mv(backend)), logger_(logger) {
  config_.validate();
  if (config_.mode == ExecutionMode::Isolated && backend_ == kj::none) {
    throw core::ConfigException("Isolated execution mode requires an isolation backend"_kj);
  }
  logger_.info(kj::str("Sandbox execution mode: ", to_string(config_.mode)));
}

SandboxExecutionWrapper::~SandboxExecutionWrapper() noexcept(false) {
  shutdown();
}

SandboxOutcome SandboxExecutionWrapper::run_direct(kj::StringPtr code) const {
  auto report = direct_.run(code);
  SandboxOutcome outcome;
  outcome.success = report.success;
  outcome.metrics = kj::mv(report.metrics);
  outcome.error = kj::mv(report.error);
  return outcome;
}

SandboxOutcome SandboxExecutionWrapper::execute(kj::StringPtr code) {
  return execute(code, config_.timeout_ms);
}

SandboxOutcome SandboxExecutionWrapper::execute(kj::StringPtr code, int64_t timeout_ms) {
  state_.lockExclusive()->stats.execution_count++;

  if (config_.mode == ExecutionMode::Direct) {
    return run_direct(code);
  }

  auto& backend = *KJ_ASSERT_NONNULL(backend_);
  kj::Maybe<kj::String> failure;
  kj::Maybe<ExecutionReport> isolated;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               try {
                 isolated = backend.execute(code, timeout_ms);
               } catch (const core::TimeoutException& e) {
                 failure = kj::str("timed out after ", e.timeout_ms(), "ms: ", e.message());
               } catch (const core::EvoGuardException& e) {
                 failure = kj::str(e.message());
               }
             })) {
    failure = kj::str(exception.getDescription());
  }

  KJ_IF_SOME(report, isolated) {
    state_.lockExclusive()->stats.last_isolation_result = IsolationResult::Succeeded;
    SandboxOutcome outcome;
    outcome.success = report.success;
    outcome.metrics = kj::mv(report.metrics);
    outcome.error = kj::mv(report.error);
    outcome.isolated = true;
    return outcome;
  }

  {
    auto lock = state_.lockExclusive();
    lock->stats.fallback_count++;
    lock->stats.last_isolation_result = IsolationResult::Failed;
  }
  kj::StringPtr reason = "no report"_kj;
  KJ_IF_SOME(f, failure) {
    reason = f;
  }
  logger_.warn(kj::str("Isolated execution via ", backend.name(), " failed (", reason,
                       "); falling back to direct execution"));
  return run_direct(code);
}

SandboxStatistics SandboxExecutionWrapper::get_statistics() const {
  return state_.lockShared()->stats;
}

IsolationResult SandboxExecutionWrapper::last_isolation_result() const {
  return state_.lockShared()->stats.last_isolation_result;
}

void SandboxExecutionWrapper::shutdown() {
  {
    auto lock = state_.lockExclusive();
    if (lock->shut_down) {
      return;
    }
    lock->shut_down = true;
  }
  KJ_IF_SOME(backend, backend_) {
    backend->cleanup_all();
    logger_.debug(kj::str("Sandbox backend ", backend->name(), " cleaned up"));
  }
}

} // namespace evoguard::sandbox
