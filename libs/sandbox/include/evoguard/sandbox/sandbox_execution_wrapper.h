/**
 * @file sandbox_execution_wrapper.h
 * @brief Execution with best-effort isolation and automatic fallback
 *
 * Code reaching the wrapper has already passed SecurityValidator; isolation
 * is the second layer. In Isolated mode any exception or timeout from the
 * backend is counted, logged at WARN and the same code is re-run through the
 * DirectExecutor. The caller sees an error only when the direct run fails
 * too. Isolation is attempted at most once per call.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/sandbox/direct_executor.h"
#include "evoguard/sandbox/isolation_backend.h"
#include "evoguard/sandbox/sandbox_config.h"

#include <cstdint>
#include <kj/memory.h>
#include <kj/mutex.h>

namespace evoguard::sandbox {

enum class IsolationResult : uint8_t {
  Unknown,
  Succeeded,
  Failed,
};

[[nodiscard]] kj::StringPtr to_string(IsolationResult result);

struct SandboxOutcome {
  bool success = false;
  Metrics metrics;
  kj::Maybe<kj::String> error;
  /// True when the metrics came from the isolation backend
  bool isolated = false;
};

struct SandboxStatistics {
  uint64_t execution_count = 0;
  uint64_t fallback_count = 0;
  IsolationResult last_isolation_result = IsolationResult::Unknown;

  [[nodiscard]] double fallback_rate() const {
    return execution_count == 0
               ? 0.0
               : static_cast<double>(fallback_count) / static_cast<double>(execution_count);
  }
  [[nodiscard]] kj::String to_json(bool pretty = false) const;
};

class SandboxExecutionWrapper {
public:
  /**
   * @param backend required in Isolated mode; ignored in Direct mode
   * @throws core::ConfigException on an invalid config or a missing backend
   */
  SandboxExecutionWrapper(const SandboxConfig& config, const DirectExecutor& direct,
                          kj::Maybe<kj::Own<IsolationBackend>> backend,
                          core::Logger& logger = core::global_logger());
  ~SandboxExecutionWrapper() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(SandboxExecutionWrapper);

  [[nodiscard]] SandboxOutcome execute(kj::StringPtr code);
  [[nodiscard]] SandboxOutcome execute(kj::StringPtr code, int64_t timeout_ms);

  [[nodiscard]] SandboxStatistics get_statistics() const;
  [[nodiscard]] IsolationResult last_isolation_result() const;
  [[nodiscard]] ExecutionMode mode() const {
    return config_.mode;
  }

  /// Releases backend resources; later calls are no-ops
  void shutdown();

private:
  struct State {
    SandboxStatistics stats;
    bool shut_down = false;
  };

  SandboxOutcome run_direct(kj::StringPtr code) const;

  SandboxConfig config_;
  const DirectExecutor& direct_;
  kj::Maybe<kj::Own<IsolationBackend>> backend_;
  core::Logger& logger_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::sandbox
