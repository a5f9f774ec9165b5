/**
 * @file logger.h
 * @brief Structured logger used across EvoGuard
 *
 * A Logger formats LogEntry records with a LogFormatter and writes them to one
 * or more LogOutput sinks. All mutable state is guarded by kj::MutexGuarded,
 * so a single Logger can be shared by concurrent mutation workers.
 *
 * Usage:
 *   auto& log = evoguard::core::global_logger();
 *   log.info(kj::str("clamped ", name, " to ", value));
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace evoguard::core {

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Critical = 5,
  Off = 6,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);
[[nodiscard]] kj::Maybe<LogLevel> parse_log_level(kj::StringPtr name);

struct LogEntry {
  LogLevel level;
  kj::String timestamp;
  kj::String file;
  int_least32_t line;
  kj::String function;
  kj::String message;
  std::chrono::system_clock::time_point time_point;
};

class LogFormatter {
public:
  virtual ~LogFormatter() = default;
  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
  [[nodiscard]] virtual kj::StringPtr name() const = 0;
};

/**
 * @brief Human readable single-line format:
 *   [2026-01-01 12:00:00.000] [INFO] file.cpp:42 - message
 */
class TextFormatter final : public LogFormatter {
public:
  explicit TextFormatter(bool include_function = false, bool use_color = false)
      : include_function_(include_function), use_color_(use_color) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "TextFormatter"_kj;
  }

private:
  bool include_function_;
  bool use_color_;

  [[nodiscard]] kj::String colorize(LogLevel level, kj::StringPtr text) const;
};

/**
 * @brief One JSON object per entry, for log shippers
 */
class JsonFormatter final : public LogFormatter {
public:
  explicit JsonFormatter(bool pretty = false) : pretty_(pretty) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "JsonFormatter"_kj;
  }

private:
  bool pretty_;
};

class LogOutput {
public:
  virtual ~LogOutput() = default;
  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Writes to stdout; Error and Critical always go to stderr
 */
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override {
    return true;
  }

private:
  bool use_stderr_;
};

/**
 * @brief Keeps formatted lines in memory for later inspection
 */
class MemoryOutput final : public LogOutput {
public:
  MemoryOutput() = default;

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override {}
  [[nodiscard]] bool is_open() const override {
    return true;
  }

  [[nodiscard]] size_t size() const;
  [[nodiscard]] bool contains(kj::StringPtr needle) const;
  [[nodiscard]] kj::Vector<kj::String> lines() const;
  void clear();

private:
  kj::MutexGuarded<kj::Vector<kj::String>> lines_;
};

class MultiOutput final : public LogOutput {
public:
  MultiOutput() = default;

  void add_output(kj::Own<LogOutput> output);
  void clear_outputs();

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;
  [[nodiscard]] size_t output_count() const;

private:
  struct MultiOutputState {
    kj::Vector<kj::Own<LogOutput>> outputs;
  };
  kj::MutexGuarded<MultiOutputState> guarded_;
};

class Logger final {
public:
  Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
         kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());
  ~Logger();

  KJ_DISALLOW_COPY_AND_MOVE(Logger);

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  void set_formatter(kj::Own<LogFormatter> formatter);
  void set_output(kj::Own<LogOutput> output);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());
  void trace(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void debug(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void info(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void warn(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void error(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void critical(kj::StringPtr message,
                const std::source_location& location = std::source_location::current());

  void flush();

private:
  struct LoggerState {
    kj::Own<LogFormatter> formatter;
    kj::Own<MultiOutput> multi_output;
    LogLevel level;

    LoggerState(kj::Own<LogFormatter> fmt, kj::Own<LogOutput> out)
        : formatter(kj::mv(fmt)), multi_output(kj::heap<MultiOutput>()), level(LogLevel::Info) {
      multi_output->add_output(kj::mv(out));
    }
  };

  kj::MutexGuarded<LoggerState> guarded_;
};

/**
 * @brief Process-wide logger, created on first use with a TextFormatter
 * writing to the console
 */
[[nodiscard]] Logger& global_logger();

} // namespace evoguard::core
