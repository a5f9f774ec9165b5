#pragma once

#include "evoguard/snippet/ast.h"

#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace evoguard::snippet {

struct SyntaxError {
  kj::String message;
  int line = 0;
  int column = 0;
};

using ParseResult = kj::OneOf<Module, SyntaxError>;

/**
 * @brief Parse snippet source into a Module
 *
 * Unsupported Python constructs (classes, lambdas, comprehensions, try,
 * with, dict literals) are reported as syntax errors.
 */
[[nodiscard]] ParseResult parse(kj::StringPtr source);

/// @throws SyntaxErrorException
[[nodiscard]] Module parse_or_throw(kj::StringPtr source);

/// kj::none when the source parses
[[nodiscard]] kj::Maybe<SyntaxError> check_syntax(kj::StringPtr source);

} // namespace evoguard::snippet
