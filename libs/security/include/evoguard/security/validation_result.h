#pragma once

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::security {

/**
 * @brief Outcome of a static check: success iff no errors were recorded
 */
struct ValidationResult {
  bool success = true;
  kj::Vector<kj::String> errors;
  kj::Vector<kj::String> warnings;

  ValidationResult() = default;
  ValidationResult(ValidationResult&&) = default;
  ValidationResult& operator=(ValidationResult&&) = default;
  KJ_DISALLOW_COPY(ValidationResult);

  static ValidationResult ok() {
    return ValidationResult();
  }
  static ValidationResult failure(kj::String error);

  void add_error(kj::String error);
  void add_warning(kj::String warning);

  [[nodiscard]] ValidationResult clone() const;
  /// First error, or empty when successful
  [[nodiscard]] kj::StringPtr first_error() const;
  /// "error1; error2"
  [[nodiscard]] kj::String summary() const;

  /// Succeeds iff every input succeeded; messages concatenated in order
  [[nodiscard]] static ValidationResult aggregate(kj::ArrayPtr<const ValidationResult> results);
};

} // namespace evoguard::security
