#pragma once

#include "evoguard/security/validation_result.h"
#include "evoguard/snippet/ast.h"

#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::security {

/**
 * @brief Static policy check run on every candidate before it is mutated or
 * executed
 *
 * Rejects imports, dynamic-execution calls and `shift` calls with a literal
 * non-positive period (look-ahead bias). Pure and deterministic; one walk
 * over the syntax tree.
 */
class SecurityValidator {
public:
  SecurityValidator() = default;

  /// eval, exec, compile, __import__, open
  [[nodiscard]] static kj::ArrayPtr<const kj::StringPtr> forbidden_calls();
  [[nodiscard]] static bool is_forbidden_call(kj::StringPtr name);

  /// Unparseable input yields a single "Syntax error: ..." error
  [[nodiscard]] ValidationResult validate(kj::StringPtr code) const;
  [[nodiscard]] ValidationResult validate(const snippet::Module& module) const;

  /// @throws core::PolicyViolation listing every error
  void require_safe(kj::StringPtr code) const;
};

} // namespace evoguard::security
