/**
 * @file isolation_backend.h
 * @brief Isolated execution of a snippet
 *
 * ProcessIsolationBackend forks one child per execution. The child applies
 * RLIMIT_AS and RLIMIT_CPU, runs the DirectExecutor, writes its report as
 * JSON to a pipe and exits. The parent waits on the pipe with poll() up to
 * the timeout, SIGKILLs the child on expiry and reaps it exactly once.
 *
 * Live children are tracked as IsolatedContext objects; cleanup_all() kills
 * and reaps whatever is still registered.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/sandbox/direct_executor.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/vector.h>
#include <sys/types.h>

namespace evoguard::sandbox {

class IsolationBackend {
public:
  virtual ~IsolationBackend() noexcept(false) = default;

  [[nodiscard]] virtual kj::StringPtr name() const = 0;

  /**
   * @brief Run `code` isolated, bounded by `timeout_ms`
   * @throws core::TimeoutException when the deadline passes
   * @throws core::IsolationException when isolation itself fails
   */
  [[nodiscard]] virtual ExecutionReport execute(kj::StringPtr code, int64_t timeout_ms) = 0;

  /// Release every isolated resource still held
  virtual void cleanup_all() = 0;
};

struct IsolationLimits {
  uint64_t memory_limit_mb = 512;
  uint64_t cpu_limit_seconds = 60;
};

struct ProcessBackendStatistics {
  uint64_t executions = 0;
  uint64_t timeouts = 0;
  uint64_t failures = 0;
  size_t active_contexts = 0;
};

class ProcessIsolationBackend final : public IsolationBackend {
public:
  ProcessIsolationBackend(const DirectExecutor& executor, IsolationLimits limits = {},
                          core::Logger& logger = core::global_logger());
  ~ProcessIsolationBackend() noexcept(false) override;

  KJ_DISALLOW_COPY_AND_MOVE(ProcessIsolationBackend);

  [[nodiscard]] kj::StringPtr name() const override {
    return "process"_kj;
  }
  [[nodiscard]] ExecutionReport execute(kj::StringPtr code, int64_t timeout_ms) override;
  void cleanup_all() override;

  [[nodiscard]] ProcessBackendStatistics get_statistics() const;

  /// Report <-> JSON wire form used on the child pipe
  [[nodiscard]] static kj::String encode_report(const ExecutionReport& report);
  /// @throws core::IsolationException on malformed input
  [[nodiscard]] static ExecutionReport decode_report(kj::StringPtr json);

private:
  class IsolatedContext;

  struct State {
    ProcessBackendStatistics stats;
    kj::Vector<pid_t> live;
  };

  [[noreturn]] void run_child(int write_fd, kj::StringPtr code) const;
  void register_child(pid_t pid);
  /// false when cleanup_all() already took the child
  bool unregister_child(pid_t pid);

  const DirectExecutor& executor_;
  IsolationLimits limits_;
  core::Logger& logger_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::sandbox
