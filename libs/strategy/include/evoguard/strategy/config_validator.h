#pragma once

#include "evoguard/core/json.h"
#include "evoguard/security/validation_result.h"
#include "evoguard/strategy/factor.h"

#include <kj/string.h>

namespace evoguard::strategy {

/**
 * @brief Validates the JSON configuration form of a strategy against a
 * factor registry
 *
 * Errors: malformed JSON, duplicate IDs, dangling dependencies, cycles,
 * unknown factor types, missing or non-numeric parameters, out-of-bounds
 * values. Unknown parameters are warnings.
 */
class StrategyConfigValidator {
public:
  explicit StrategyConfigValidator(const FactorRegistry& registry = FactorRegistry::builtin())
      : registry_(registry) {}

  [[nodiscard]] security::ValidationResult validate(kj::StringPtr json) const;
  [[nodiscard]] security::ValidationResult validate(const core::JsonValue& root) const;

private:
  const FactorRegistry& registry_;
};

} // namespace evoguard::strategy
