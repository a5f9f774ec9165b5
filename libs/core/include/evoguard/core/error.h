/**
 * @file error.h
 * @brief Exception hierarchy and error codes shared by every EvoGuard library
 *
 * Exceptions carry the source location they were raised from and map onto a
 * kj::Exception::Type so they can be rethrown through KJ infrastructure.
 * Precondition failures inside the libraries use KJ_REQUIRE directly; the
 * typed exceptions below are reserved for errors callers are expected to
 * distinguish (configuration, isolation, policy).
 */

#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace evoguard::core {

/**
 * @brief Base class for all EvoGuard exceptions
 */
class EvoGuardException {
public:
  explicit EvoGuardException(kj::StringPtr message,
                             kj::Exception::Type type = kj::Exception::Type::FAILED,
                             const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        function_(kj::str(location.function_name())), type_(type) {}

  explicit EvoGuardException(kj::Exception&& e)
      : message_(kj::str(e.getDescription())), file_(kj::str(e.getFile())), line_(e.getLine()),
        function_(kj::str("")), type_(e.getType()) {}

  virtual ~EvoGuardException() = default;

  EvoGuardException(EvoGuardException&&) = default;
  EvoGuardException& operator=(EvoGuardException&&) = default;

  // kj::String is move-only
  EvoGuardException(const EvoGuardException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        function_(kj::str(other.function_)), type_(other.type_) {}

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] kj::StringPtr function() const noexcept {
    return function_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }
  [[nodiscard]] const char* what() const noexcept {
    return message_.cStr();
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(message_));
  }

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  kj::String function_;
  kj::Exception::Type type_;
};

class ParseException : public EvoGuardException {
public:
  explicit ParseException(kj::StringPtr message,
                          const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::FAILED, location) {}
};

class ValidationException : public EvoGuardException {
public:
  explicit ValidationException(kj::StringPtr message,
                               const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::FAILED, location) {}
};

/**
 * @brief Invalid engine configuration; raised at construction time only
 */
class ConfigException : public EvoGuardException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::FAILED, location) {}
};

class TimeoutException : public EvoGuardException {
public:
  explicit TimeoutException(kj::StringPtr message, int64_t timeout_ms = 0,
                            const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::OVERLOADED, location),
        timeout_ms_(timeout_ms) {}

  [[nodiscard]] int64_t timeout_ms() const noexcept {
    return timeout_ms_;
  }

private:
  int64_t timeout_ms_;
};

class ResourceException : public EvoGuardException {
public:
  explicit ResourceException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::OVERLOADED, location) {}
};

/**
 * @brief Failure of the isolated execution backend (spawn, crash, bad output)
 */
class IsolationException : public EvoGuardException {
public:
  explicit IsolationException(kj::StringPtr message, int exit_status = 0,
                              const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::DISCONNECTED, location),
        exit_status_(exit_status) {}

  [[nodiscard]] int exit_status() const noexcept {
    return exit_status_;
  }

private:
  int exit_status_;
};

/**
 * @brief A candidate was rejected by the security policy
 */
class PolicyViolation : public EvoGuardException {
public:
  explicit PolicyViolation(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : EvoGuardException(message, kj::Exception::Type::FAILED, location) {}
};

enum class ErrorCode : int {
  Success = 0,
  UnknownError = 1,
  ParseError = 2,
  ValidationError = 3,
  PolicyViolation = 4,
  MutationFailure = 5,
  TierExhaustion = 6,
  IsolationFailure = 7,
  TimeoutError = 8,
  ResourceError = 9,
  ConfigurationError = 10,
  ExecutionError = 11,
};

[[nodiscard]] kj::String to_string(ErrorCode code);
[[nodiscard]] ErrorCode to_error_code(kj::StringPtr str);

#define EVOGUARD_REQUIRE(condition, ...) KJ_REQUIRE(condition, ##__VA_ARGS__)
#define EVOGUARD_FAIL_REQUIRE(...) KJ_FAIL_REQUIRE(__VA_ARGS__)

} // namespace evoguard::core
