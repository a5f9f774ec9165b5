#pragma once

#include <chrono>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::core {

[[nodiscard]] std::int64_t now_unix_ns();
[[nodiscard]] kj::String now_utc_iso8601();

/**
 * @brief Monotonic stopwatch for measuring mutation and execution durations
 */
class Stopwatch final {
public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}

  void restart() {
    start_ = std::chrono::steady_clock::now();
  }

  [[nodiscard]] double elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
  }

  [[nodiscard]] int64_t elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start_)
        .count();
  }

private:
  std::chrono::steady_clock::time_point start_;
};

} // namespace evoguard::core
