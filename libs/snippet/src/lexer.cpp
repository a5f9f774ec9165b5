#include "evoguard/snippet/lexer.h"

#include <cstdlib>

namespace evoguard::snippet {

namespace {

bool is_ident_start(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

bool is_ident_char(char c) {
  return is_ident_start(c) || is_digit(c);
}

[[noreturn]] void fail(kj::StringPtr message, int line, int column) {
  throw SyntaxErrorException(message, line, column);
}

class Lexer {
public:
  explicit Lexer(kj::StringPtr source) : src_(source) {
    indents_.add(0);
  }

  kj::Vector<Token> run() {
    while (pos_ < src_.size()) {
      if (at_line_start_) {
        handle_indentation();
        continue;
      }
      char c = src_[pos_];
      if (c == '\n') {
        newline();
        continue;
      }
      if (c == ' ' || c == '\t' || c == '\r') {
        advance();
        continue;
      }
      if (c == '#') {
        skip_comment();
        continue;
      }
      if (c == '\\' && peek(1) == '\n') {
        advance();
        advance();
        line_++;
        col_ = 1;
        continue;
      }
      if (is_ident_start(c)) {
        lex_name();
      } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
        lex_number();
      } else if (c == '\'' || c == '"') {
        lex_string();
      } else {
        lex_operator();
      }
    }

    if (!last_was_newline()) {
      push(Token::Kind::Newline, kj::String());
    }
    while (indents_.size() > 1) {
      indents_.removeLast();
      push(Token::Kind::Dedent, kj::String());
    }
    push(Token::Kind::EndOfFile, kj::String());
    return kj::mv(tokens_);
  }

private:
  kj::StringPtr src_;
  size_t pos_ = 0;
  int line_ = 1;
  int col_ = 1;
  int bracket_depth_ = 0;
  bool at_line_start_ = true;
  kj::Vector<int> indents_;
  kj::Vector<Token> tokens_;

  char peek(size_t offset) const {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
  }

  void advance() {
    pos_++;
    col_++;
  }

  bool last_was_newline() const {
    return tokens_.empty() || tokens_.back().kind == Token::Kind::Newline ||
           tokens_.back().kind == Token::Kind::Dedent || tokens_.back().kind == Token::Kind::Indent;
  }

  Token& push(Token::Kind kind, kj::String text) {
    tokens_.add(Token{.kind = kind, .text = kj::mv(text), .line = line_, .column = col_});
    return tokens_.back();
  }

  void newline() {
    if (bracket_depth_ == 0 && !last_was_newline()) {
      push(Token::Kind::Newline, kj::String());
    }
    pos_++;
    line_++;
    col_ = 1;
    if (bracket_depth_ == 0) {
      at_line_start_ = true;
    }
  }

  void skip_comment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') {
      advance();
    }
  }

  void handle_indentation() {
    int width = 0;
    size_t p = pos_;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) {
      width += src_[p] == '\t' ? 8 - (width % 8) : 1;
      p++;
    }
    // Blank and comment-only lines do not affect indentation
    if (p >= src_.size() || src_[p] == '\n' || src_[p] == '#' ||
        (src_[p] == '\r' && p + 1 < src_.size() && src_[p + 1] == '\n')) {
      col_ += static_cast<int>(p - pos_);
      pos_ = p;
      if (pos_ < src_.size() && src_[pos_] == '#') {
        skip_comment();
      }
      if (pos_ < src_.size() && src_[pos_] == '\r') {
        advance();
      }
      if (pos_ < src_.size()) {
        pos_++;
        line_++;
        col_ = 1;
      }
      return;
    }

    col_ += static_cast<int>(p - pos_);
    pos_ = p;
    at_line_start_ = false;

    if (width > indents_.back()) {
      indents_.add(width);
      push(Token::Kind::Indent, kj::String());
    } else {
      while (width < indents_.back()) {
        indents_.removeLast();
        push(Token::Kind::Dedent, kj::String());
      }
      if (width != indents_.back()) {
        fail("unindent does not match any outer indentation level"_kj, line_, col_);
      }
    }
  }

  void lex_name() {
    size_t start = pos_;
    int col = col_;
    while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
      advance();
    }
    auto& tok = push(Token::Kind::Name, kj::heapString(src_.slice(start, pos_)));
    tok.column = col;
  }

  void lex_number() {
    size_t start = pos_;
    int col = col_;
    bool is_integer = true;
    while (is_digit(peek(0)) || peek(0) == '_') {
      advance();
    }
    if (peek(0) == '.') {
      is_integer = false;
      advance();
      while (is_digit(peek(0))) {
        advance();
      }
    }
    if (peek(0) == 'e' || peek(0) == 'E') {
      size_t save_pos = pos_;
      int save_col = col_;
      advance();
      if (peek(0) == '+' || peek(0) == '-') {
        advance();
      }
      if (!is_digit(peek(0))) {
        pos_ = save_pos;
        col_ = save_col;
      } else {
        is_integer = false;
        while (is_digit(peek(0))) {
          advance();
        }
      }
    }
    if (is_ident_start(peek(0))) {
      fail("invalid decimal literal"_kj, line_, col_);
    }

    kj::Vector<char> digits;
    for (size_t i = start; i < pos_; ++i) {
      if (src_[i] != '_') {
        digits.add(src_[i]);
      }
    }
    digits.add('\0');

    auto& tok = push(Token::Kind::Number, kj::heapString(src_.slice(start, pos_)));
    tok.column = col;
    tok.number = std::strtod(digits.begin(), nullptr);
    tok.is_integer = is_integer;
  }

  void lex_string() {
    char quote = src_[pos_];
    int col = col_;
    int line = line_;
    advance();
    kj::Vector<char> out;
    while (true) {
      if (pos_ >= src_.size() || src_[pos_] == '\n') {
        fail("unterminated string literal"_kj, line, col);
      }
      char c = src_[pos_];
      if (c == quote) {
        advance();
        break;
      }
      if (c == '\\' && pos_ + 1 < src_.size()) {
        char next = src_[pos_ + 1];
        switch (next) {
        case 'n':
          out.add('\n');
          break;
        case 't':
          out.add('\t');
          break;
        case '\\':
        case '\'':
        case '"':
          out.add(next);
          break;
        default:
          out.add('\\');
          out.add(next);
        }
        advance();
        advance();
        continue;
      }
      out.add(c);
      advance();
    }
    auto& tok = push(Token::Kind::String, kj::heapString(out.begin(), out.size()));
    tok.column = col;
  }

  void lex_operator() {
    static constexpr kj::StringPtr kThreeChar[] = {"**="_kj, "//="_kj};
    static constexpr kj::StringPtr kTwoChar[] = {"**"_kj, "//"_kj, "<="_kj, ">="_kj, "=="_kj,
                                                 "!="_kj, "+="_kj, "-="_kj, "*="_kj, "/="_kj,
                                                 "->"_kj};
    int col = col_;
    auto rest = src_.slice(pos_);
    for (auto op : kThreeChar) {
      if (rest.startsWith(op)) {
        pos_ += 3;
        col_ += 3;
        push(Token::Kind::Op, kj::str(op)).column = col;
        return;
      }
    }
    for (auto op : kTwoChar) {
      if (rest.startsWith(op)) {
        pos_ += 2;
        col_ += 2;
        push(Token::Kind::Op, kj::str(op)).column = col;
        return;
      }
    }

    char c = src_[pos_];
    switch (c) {
    case '(':
    case '[':
    case '{':
      bracket_depth_++;
      break;
    case ')':
    case ']':
    case '}':
      if (bracket_depth_ == 0) {
        fail(kj::str("unmatched '", c, "'"), line_, col_);
      }
      bracket_depth_--;
      break;
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '<':
    case '>':
    case '=':
    case '.':
    case ',':
    case ':':
    case '&':
    case '|':
    case '~':
    case ';':
      break;
    default:
      fail(kj::str("invalid character '", c, "'"), line_, col_);
    }
    advance();
    push(Token::Kind::Op, kj::heapString(&c, 1)).column = col;
  }
};

} // namespace

kj::Vector<Token> tokenize(kj::StringPtr source) {
  return Lexer(source).run();
}

} // namespace evoguard::snippet
