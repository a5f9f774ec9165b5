#pragma once

#include "evoguard/security/validation_result.h"
#include "evoguard/snippet/ast.h"

#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::security {

/**
 * @brief Post-mutation check for code produced by tree rewrites
 *
 * Stricter than SecurityValidator on names: any reference (not only a call)
 * to a forbidden or introspection name is an error, as is dunder attribute
 * access. Also flags loops that cannot terminate.
 */
class ASTValidator {
public:
  ASTValidator() = default;

  [[nodiscard]] static bool is_forbidden_name(kj::StringPtr name);

  [[nodiscard]] ValidationResult validate(kj::StringPtr code) const;
  [[nodiscard]] ValidationResult validate(const snippet::Module& module) const;

  /// Syntax and forbidden names only; stops at the first problem
  [[nodiscard]] bool validate_fast(kj::StringPtr code) const;
};

} // namespace evoguard::security
