#pragma once

#include "evoguard/core/error.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::snippet {

struct Token {
  enum class Kind : uint8_t { Name, Number, String, Op, Newline, Indent, Dedent, EndOfFile };

  Kind kind;
  kj::String text; // identifier, operator, decoded string, or number spelling
  double number = 0.0;
  bool is_integer = false;
  int line = 0;
  int column = 0;
};

/**
 * @brief Raised by the lexer and parser; carries the position separately so
 * validators can report it
 */
class SyntaxErrorException : public core::ParseException {
public:
  SyntaxErrorException(kj::StringPtr message, int line, int column)
      : core::ParseException(kj::str(message, " (line ", line, ", column ", column, ")")),
        reason_(kj::str(message)), line_(line), column_(column) {}

  SyntaxErrorException(const SyntaxErrorException& other)
      : core::ParseException(other), reason_(kj::str(other.reason_)), line_(other.line_),
        column_(other.column_) {}

  [[nodiscard]] kj::StringPtr reason() const noexcept {
    return reason_;
  }
  [[nodiscard]] int error_line() const noexcept {
    return line_;
  }
  [[nodiscard]] int error_column() const noexcept {
    return column_;
  }

private:
  kj::String reason_;
  int line_;
  int column_;
};

/**
 * @brief Splits snippet source into tokens, emitting Indent/Dedent for block
 * structure and suppressing newlines inside brackets.
 *
 * @throws SyntaxErrorException on malformed input (bad indentation,
 *         unterminated string, stray character)
 */
[[nodiscard]] kj::Vector<Token> tokenize(kj::StringPtr source);

} // namespace evoguard::snippet
