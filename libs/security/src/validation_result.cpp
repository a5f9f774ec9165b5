#include "evoguard/security/validation_result.h"

namespace evoguard::security {

ValidationResult ValidationResult::failure(kj::String error) {
  ValidationResult result;
  result.add_error(kj::mv(error));
  return result;
}

void ValidationResult::add_error(kj::String error) {
  success = false;
  errors.add(kj::mv(error));
}

void ValidationResult::add_warning(kj::String warning) {
  warnings.add(kj::mv(warning));
}

ValidationResult ValidationResult::clone() const {
  ValidationResult copy;
  copy.success = success;
  for (auto& e : errors) {
    copy.errors.add(kj::str(e));
  }
  for (auto& w : warnings) {
    copy.warnings.add(kj::str(w));
  }
  return copy;
}

kj::StringPtr ValidationResult::first_error() const {
  if (errors.empty()) {
    return ""_kj;
  }
  return errors[0];
}

kj::String ValidationResult::summary() const {
  return kj::strArray(errors, "; ");
}

ValidationResult ValidationResult::aggregate(kj::ArrayPtr<const ValidationResult> results) {
  ValidationResult combined;
  for (auto& r : results) {
    combined.success = combined.success && r.success;
    for (auto& e : r.errors) {
      combined.errors.add(kj::str(e));
    }
    for (auto& w : r.warnings) {
      combined.warnings.add(kj::str(w));
    }
  }
  return combined;
}

} // namespace evoguard::security
