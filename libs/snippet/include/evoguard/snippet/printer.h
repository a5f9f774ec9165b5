#pragma once

#include "evoguard/snippet/ast.h"

#include <kj/string.h>

namespace evoguard::snippet {

/**
 * @brief Render a tree back to canonical source
 *
 * Output always re-parses to an equivalent tree. Number literals keep their
 * original spelling unless a rewriter cleared Expr::text.
 */
[[nodiscard]] kj::String print(const Module& module);
[[nodiscard]] kj::String print(const Stmt& stmt, int indent = 0);
[[nodiscard]] kj::String print(const Expr& expr);

/// Shortest round-trippable spelling of a number ("3", "0.15", "1e-06")
[[nodiscard]] kj::String format_number(double value, bool is_integer);

} // namespace evoguard::snippet
