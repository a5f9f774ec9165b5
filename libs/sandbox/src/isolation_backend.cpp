#include "evoguard/sandbox/isolation_backend.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/core/time.h"

#include <cerrno>
#include <cstring>
#include <kj/debug.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evoguard::sandbox {

namespace {

constexpr int kChildInternalError = 3;

void write_all(int fd, kj::StringPtr text) {
  const char* pos = text.begin();
  size_t remaining = text.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, pos, remaining);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      _exit(kChildInternalError);
    }
    pos += n;
    remaining -= static_cast<size_t>(n);
  }
}

void set_limit(int resource, rlim_t value) {
  struct rlimit limit;
  limit.rlim_cur = value;
  limit.rlim_max = value;
  if (::setrlimit(resource, &limit) != 0) {
    _exit(kChildInternalError);
  }
}

} // namespace

/**
 * One forked child and the read end of its pipe. The destructor kills and
 * reaps a child that was not reaped yet, so every exit path from execute()
 * releases the process exactly once.
 */
class ProcessIsolationBackend::IsolatedContext {
public:
  IsolatedContext(ProcessIsolationBackend& backend, pid_t pid, int read_fd)
      : backend_(backend), pid_(pid), read_fd_(read_fd) {
    backend_.register_child(pid_);
  }

  ~IsolatedContext() noexcept(false) {
    if (!reaped_) {
      kill_and_reap();
    }
    if (read_fd_ >= 0) {
      ::close(read_fd_);
    }
  }

  KJ_DISALLOW_COPY_AND_MOVE(IsolatedContext);

  [[nodiscard]] int fd() const {
    return read_fd_;
  }

  void kill_and_reap() {
    if (!reaped_ && backend_.unregister_child(pid_)) {
      ::kill(pid_, SIGKILL);
      int status = 0;
      if (::waitpid(pid_, &status, 0) < 0) {
        KJ_LOG(WARNING, "failed to reap killed isolated process", pid_, std::strerror(errno));
      }
    }
    reaped_ = true;
  }

  /// Wait for the child to exit. kj::none when cleanup_all() reaped it first.
  kj::Maybe<int> reap() {
    bool owned = !reaped_ && backend_.unregister_child(pid_);
    reaped_ = true;
    if (!owned) {
      return kj::none;
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
      if (errno != EINTR) {
        throw core::IsolationException(
            kj::str("waitpid failed for isolated process: ", std::strerror(errno)));
      }
    }
    return status;
  }

private:
  ProcessIsolationBackend& backend_;
  pid_t pid_;
  int read_fd_;
  bool reaped_ = false;
};

ProcessIsolationBackend::ProcessIsolationBackend(const DirectExecutor& executor,
                                                 IsolationLimits limits, core::Logger& logger)
    : executor_(executor), limits_(limits), logger_(logger) {}

ProcessIsolationBackend::~ProcessIsolationBackend() noexcept(false) {
  cleanup_all();
}

void ProcessIsolationBackend::register_child(pid_t pid) {
  state_.lockExclusive()->live.add(pid);
}

bool ProcessIsolationBackend::unregister_child(pid_t pid) {
  auto lock = state_.lockExclusive();
  for (size_t i = 0; i < lock->live.size(); ++i) {
    if (lock->live[i] == pid) {
      lock->live[i] = lock->live.back();
      lock->live.removeLast();
      return true;
    }
  }
  return false;
}

void ProcessIsolationBackend::run_child(int write_fd, kj::StringPtr code) const {
  set_limit(RLIMIT_AS, static_cast<rlim_t>(limits_.memory_limit_mb) * 1024 * 1024);
  set_limit(RLIMIT_CPU, static_cast<rlim_t>(limits_.cpu_limit_seconds));

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto report = executor_.run(code);
               write_all(write_fd, encode_report(report));
             })) {
    (void)exception;
    _exit(kChildInternalError);
  }
  ::close(write_fd);
  _exit(0);
}

ExecutionReport ProcessIsolationBackend::execute(kj::StringPtr code, int64_t timeout_ms) {
  int fds[2];
  if (::pipe(fds) < 0) {
    throw core::IsolationException(kj::str("Failed to create pipe: ", std::strerror(errno)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int saved_errno = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    throw core::IsolationException(kj::str("Failed to fork: ", std::strerror(saved_errno)));
  }
  if (pid == 0) {
    ::close(fds[0]);
    run_child(fds[1], code);
  }

  ::close(fds[1]);
  IsolatedContext context(*this, pid, fds[0]);
  ++state_.lockExclusive()->stats.executions;
  logger_.debug(kj::str("Isolated execution started in process ", pid));

  core::Stopwatch stopwatch;
  kj::Vector<char> output;
  char chunk[4096];
  for (;;) {
    int64_t remaining = timeout_ms - stopwatch.elapsed_ms();
    if (remaining <= 0) {
      context.kill_and_reap();
      ++state_.lockExclusive()->stats.timeouts;
      throw core::TimeoutException(
          kj::str("Isolated execution exceeded ", timeout_ms, " ms"), timeout_ms);
    }

    struct pollfd pfd;
    pfd.fd = context.fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, static_cast<int>(kj::min(remaining, int64_t(1000))));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ++state_.lockExclusive()->stats.failures;
      throw core::IsolationException(kj::str("poll failed: ", std::strerror(errno)));
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = ::read(context.fd(), chunk, sizeof(chunk));
    if (n > 0) {
      output.addAll(chunk, chunk + n);
      continue;
    }
    if (n == 0) {
      break;
    }
    if (errno != EINTR && errno != EAGAIN) {
      ++state_.lockExclusive()->stats.failures;
      throw core::IsolationException(kj::str("read failed: ", std::strerror(errno)));
    }
  }

  auto reaped = context.reap();
  auto status = KJ_UNWRAP_OR(reaped, {
    ++state_.lockExclusive()->stats.failures;
    throw core::IsolationException("Isolated process was terminated by cleanup"_kj);
  });
  if (WIFSIGNALED(status)) {
    ++state_.lockExclusive()->stats.failures;
    throw core::IsolationException(
        kj::str("Isolated process killed by signal ", WTERMSIG(status)),
        128 + WTERMSIG(status));
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code_value = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    ++state_.lockExclusive()->stats.failures;
    throw core::IsolationException(
        kj::str("Isolated process exited with status ", code_value), code_value);
  }

  try {
    return decode_report(kj::heapString(output.begin(), output.size()));
  } catch (const core::IsolationException&) {
    ++state_.lockExclusive()->stats.failures;
    throw;
  }
}

void ProcessIsolationBackend::cleanup_all() {
  kj::Vector<pid_t> survivors;
  {
    auto lock = state_.lockExclusive();
    survivors = kj::mv(lock->live);
    lock->live = kj::Vector<pid_t>();
  }
  for (auto pid : survivors) {
    ::kill(pid, SIGKILL);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) {
      KJ_LOG(WARNING, "failed to reap isolated process on cleanup", pid, std::strerror(errno));
    }
  }
  if (!survivors.empty()) {
    logger_.warn(kj::str("Terminated ", survivors.size(), " isolated process(es) on cleanup"));
  }
}

ProcessBackendStatistics ProcessIsolationBackend::get_statistics() const {
  auto lock = state_.lockShared();
  auto stats = lock->stats;
  stats.active_contexts = lock->live.size();
  return stats;
}

kj::String ProcessIsolationBackend::encode_report(const ExecutionReport& report) {
  auto builder = core::JsonBuilder::object();
  builder.put("success", report.success);
  builder.put_object("metrics", [&](core::JsonBuilder& metrics) {
    for (auto& entry : report.metrics) {
      metrics.put(entry.key, entry.value);
    }
  });
  KJ_IF_SOME(error, report.error) {
    builder.put("error", error.asPtr());
  }
  return builder.build();
}

ExecutionReport ProcessIsolationBackend::decode_report(kj::StringPtr json) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse(json); })) {
    throw core::IsolationException(
        kj::str("Malformed output from isolated process: ", exception.getDescription()));
  }
  auto root = doc.root();
  if (!root.is_object() || !root["success"].is_bool() || !root["metrics"].is_object()) {
    throw core::IsolationException("Malformed output from isolated process"_kj);
  }

  ExecutionReport report;
  report.success = root["success"].get_bool();
  root["metrics"].for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
    if (value.is_number()) {
      report.metrics.insert(kj::str(key), value.get_double());
    }
  });
  KJ_IF_SOME(error, root["error"].get_string_ptr()) {
    report.error = kj::str(error);
  }
  return report;
}

} // namespace evoguard::sandbox
