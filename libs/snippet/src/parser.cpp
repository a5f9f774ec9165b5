#include "evoguard/snippet/parser.h"

#include "evoguard/snippet/lexer.h"

#include <kj/common.h>
#include <type_traits>

namespace evoguard::snippet {

namespace {

constexpr size_t kMaxSourceBytes = 1 << 20;

// Bounds parser recursion and the depth of every tree built from its output
constexpr int kMaxNesting = 100;

bool is_reserved(kj::StringPtr word) {
  static constexpr kj::StringPtr kReserved[] = {
      "False"_kj,  "None"_kj,   "True"_kj,     "and"_kj,    "as"_kj,     "assert"_kj,
      "async"_kj,  "await"_kj,  "break"_kj,    "class"_kj,  "continue"_kj, "def"_kj,
      "del"_kj,    "elif"_kj,   "else"_kj,     "except"_kj, "finally"_kj, "for"_kj,
      "from"_kj,   "global"_kj, "if"_kj,       "import"_kj, "in"_kj,     "is"_kj,
      "lambda"_kj, "nonlocal"_kj, "not"_kj,    "or"_kj,     "pass"_kj,   "raise"_kj,
      "return"_kj, "try"_kj,    "while"_kj,    "with"_kj,   "yield"_kj};
  for (auto kw : kReserved) {
    if (word == kw) {
      return true;
    }
  }
  return false;
}

class Parser {
public:
  explicit Parser(kj::Vector<Token> tokens) : tokens_(kj::mv(tokens)) {}

  Module parse_module() {
    Module module;
    while (!at(Token::Kind::EndOfFile)) {
      if (at(Token::Kind::Newline)) {
        next();
        continue;
      }
      parse_statement(module.body);
    }
    return module;
  }

private:
  kj::Vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_ = 0;

  /// Nesting levels and chained operands charged while in scope
  class NestingGuard {
  public:
    explicit NestingGuard(Parser& parser, bool charge = true) : parser_(parser) {
      if (charge) {
        enter();
      }
    }
    ~NestingGuard() {
      parser_.depth_ -= count_;
    }
    KJ_DISALLOW_COPY_AND_MOVE(NestingGuard);

    void enter() {
      ++count_;
      if (++parser_.depth_ > kMaxNesting) {
        parser_.fail("expression too deeply nested"_kj);
      }
    }

  private:
    Parser& parser_;
    int count_ = 0;
  };

  // ---------------------------------------------------------------- helpers

  const Token& peek(size_t offset = 0) const {
    size_t idx = pos_ + offset;
    return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
  }

  const Token& next() {
    const Token& tok = peek();
    if (pos_ < tokens_.size() - 1) {
      pos_++;
    }
    return tok;
  }

  bool at(Token::Kind kind) const {
    return peek().kind == kind;
  }

  bool at_op(kj::StringPtr op) const {
    return peek().kind == Token::Kind::Op && peek().text == op;
  }

  bool at_keyword(kj::StringPtr word) const {
    return peek().kind == Token::Kind::Name && peek().text == word;
  }

  bool accept_op(kj::StringPtr op) {
    if (at_op(op)) {
      next();
      return true;
    }
    return false;
  }

  bool accept_keyword(kj::StringPtr word) {
    if (at_keyword(word)) {
      next();
      return true;
    }
    return false;
  }

  [[noreturn]] void fail(kj::StringPtr message) const {
    const Token& tok = peek();
    throw SyntaxErrorException(message, tok.line, tok.column);
  }

  [[noreturn]] void fail_unexpected() const {
    const Token& tok = peek();
    switch (tok.kind) {
    case Token::Kind::Newline:
      fail("unexpected end of line"_kj);
    case Token::Kind::Indent:
      fail("unexpected indent"_kj);
    case Token::Kind::Dedent:
      fail("unexpected dedent"_kj);
    case Token::Kind::EndOfFile:
      fail("unexpected end of input"_kj);
    default:
      fail(kj::str("invalid syntax near '", tok.text, "'"));
    }
  }

  void expect_op(kj::StringPtr op) {
    if (!accept_op(op)) {
      fail(kj::str("expected '", op, "'"));
    }
  }

  void expect_keyword(kj::StringPtr word) {
    if (!accept_keyword(word)) {
      fail(kj::str("expected '", word, "'"));
    }
  }

  kj::String expect_identifier() {
    if (!at(Token::Kind::Name) || is_reserved(peek().text)) {
      fail("expected identifier"_kj);
    }
    return kj::str(next().text);
  }

  void expect_newline() {
    if (at(Token::Kind::Newline)) {
      next();
      return;
    }
    if (at(Token::Kind::EndOfFile) || at(Token::Kind::Dedent)) {
      return;
    }
    fail_unexpected();
  }

  template <typename Node> kj::Own<Node> node(typename Node::Kind kind, const Token& at_token) {
    auto n = kj::heap<Node>(kind);
    n->line = at_token.line;
    if constexpr (std::is_same_v<Node, Expr>) {
      n->column = at_token.column;
    }
    return n;
  }

  // ------------------------------------------------------------- statements

  void parse_statement(kj::Vector<StmtPtr>& out) {
    if (at(Token::Kind::Indent)) {
      fail("unexpected indent"_kj);
    }
    if (at_keyword("if"_kj)) {
      out.add(parse_if());
    } else if (at_keyword("while"_kj)) {
      out.add(parse_while());
    } else if (at_keyword("for"_kj)) {
      out.add(parse_for());
    } else if (at_keyword("def"_kj)) {
      out.add(parse_def());
    } else {
      parse_simple_statements(out);
    }
  }

  void parse_simple_statements(kj::Vector<StmtPtr>& out) {
    out.add(parse_small_statement());
    while (accept_op(";"_kj)) {
      if (at(Token::Kind::Newline) || at(Token::Kind::EndOfFile)) {
        break;
      }
      out.add(parse_small_statement());
    }
    expect_newline();
  }

  StmtPtr parse_small_statement() {
    const Token& start = peek();
    if (accept_keyword("pass"_kj)) {
      return node<Stmt>(Stmt::Kind::Pass, start);
    }
    if (accept_keyword("break"_kj)) {
      return node<Stmt>(Stmt::Kind::Break, start);
    }
    if (accept_keyword("continue"_kj)) {
      return node<Stmt>(Stmt::Kind::Continue, start);
    }
    if (accept_keyword("return"_kj)) {
      auto stmt = node<Stmt>(Stmt::Kind::Return, start);
      if (!at(Token::Kind::Newline) && !at(Token::Kind::EndOfFile) && !at_op(";"_kj)) {
        stmt->value = parse_testlist();
      }
      return stmt;
    }
    if (at_keyword("import"_kj)) {
      return parse_import();
    }
    if (at_keyword("from"_kj)) {
      return parse_from_import();
    }
    if (at(Token::Kind::Name) && is_reserved(peek().text) && !at_keyword("not"_kj) &&
        !at_keyword("True"_kj) && !at_keyword("False"_kj) && !at_keyword("None"_kj) &&
        !at_keyword("lambda"_kj)) {
      fail(kj::str("unsupported statement '", peek().text, "'"));
    }

    auto expr = parse_testlist();
    if (accept_op("="_kj)) {
      check_assign_target(*expr);
      auto stmt = node<Stmt>(Stmt::Kind::Assign, start);
      stmt->target = kj::mv(expr);
      stmt->value = parse_testlist();
      if (at_op("="_kj)) {
        fail("chained assignment is not supported"_kj);
      }
      return stmt;
    }
    static constexpr struct {
      kj::StringPtr op;
      BinaryOp bin;
    } kAugOps[] = {{"+="_kj, BinaryOp::Add},
                   {"-="_kj, BinaryOp::Sub},
                   {"*="_kj, BinaryOp::Mul},
                   {"/="_kj, BinaryOp::Div},
                   {"//="_kj, BinaryOp::FloorDiv},
                   {"**="_kj, BinaryOp::Pow}};
    for (auto& aug : kAugOps) {
      if (accept_op(aug.op)) {
        check_assign_target(*expr);
        auto stmt = node<Stmt>(Stmt::Kind::AugAssign, start);
        stmt->target = kj::mv(expr);
        stmt->aug_op = aug.bin;
        stmt->value = parse_test();
        return stmt;
      }
    }

    auto stmt = node<Stmt>(Stmt::Kind::ExprStmt, start);
    stmt->value = kj::mv(expr);
    return stmt;
  }

  void check_assign_target(const Expr& target) {
    switch (target.kind) {
    case Expr::Kind::Name:
    case Expr::Kind::Attribute:
    case Expr::Kind::Subscript:
      return;
    case Expr::Kind::Tuple:
    case Expr::Kind::List:
      for (auto& child : target.children) {
        check_assign_target(*child);
      }
      return;
    default:
      throw SyntaxErrorException("cannot assign to expression"_kj, target.line, target.column);
    }
  }

  kj::String parse_dotted_name() {
    auto name = expect_identifier();
    while (accept_op("."_kj)) {
      name = kj::str(name, ".", expect_identifier());
    }
    return name;
  }

  StmtPtr parse_import() {
    auto stmt = node<Stmt>(Stmt::Kind::Import, peek());
    expect_keyword("import"_kj);
    do {
      ImportAlias alias{parse_dotted_name(), kj::none};
      if (accept_keyword("as"_kj)) {
        alias.as_name = expect_identifier();
      }
      stmt->aliases.add(kj::mv(alias));
    } while (accept_op(","_kj));
    return stmt;
  }

  StmtPtr parse_from_import() {
    auto stmt = node<Stmt>(Stmt::Kind::ImportFrom, peek());
    expect_keyword("from"_kj);
    kj::String prefix;
    while (at_op("."_kj)) {
      next();
      prefix = kj::str(prefix, ".");
    }
    stmt->name = at_keyword("import"_kj) ? kj::mv(prefix) : kj::str(prefix, parse_dotted_name());
    expect_keyword("import"_kj);
    if (accept_op("*"_kj)) {
      stmt->aliases.add(ImportAlias{kj::str("*"), kj::none});
      return stmt;
    }
    bool parenthesized = accept_op("("_kj);
    do {
      if (parenthesized && at_op(")"_kj)) {
        break;
      }
      ImportAlias alias{expect_identifier(), kj::none};
      if (accept_keyword("as"_kj)) {
        alias.as_name = expect_identifier();
      }
      stmt->aliases.add(kj::mv(alias));
    } while (accept_op(","_kj));
    if (parenthesized) {
      expect_op(")"_kj);
    }
    return stmt;
  }

  kj::Vector<StmtPtr> parse_suite() {
    NestingGuard block(*this);
    expect_op(":"_kj);
    kj::Vector<StmtPtr> body;
    if (!at(Token::Kind::Newline)) {
      parse_simple_statements(body);
      return body;
    }
    next();
    while (at(Token::Kind::Newline)) {
      next();
    }
    if (!at(Token::Kind::Indent)) {
      fail("expected an indented block"_kj);
    }
    next();
    while (!at(Token::Kind::Dedent) && !at(Token::Kind::EndOfFile)) {
      if (at(Token::Kind::Newline)) {
        next();
        continue;
      }
      parse_statement(body);
    }
    if (at(Token::Kind::Dedent)) {
      next();
    }
    return body;
  }

  StmtPtr parse_if() {
    auto stmt = node<Stmt>(Stmt::Kind::If, peek());
    next(); // 'if' or 'elif'
    stmt->test = parse_test();
    stmt->body = parse_suite();
    if (at_keyword("elif"_kj)) {
      NestingGuard chain(*this);
      stmt->orelse.add(parse_if());
    } else if (accept_keyword("else"_kj)) {
      stmt->orelse = parse_suite();
    }
    return stmt;
  }

  StmtPtr parse_while() {
    auto stmt = node<Stmt>(Stmt::Kind::While, peek());
    expect_keyword("while"_kj);
    stmt->test = parse_test();
    stmt->body = parse_suite();
    if (at_keyword("else"_kj)) {
      fail("while/else is not supported"_kj);
    }
    return stmt;
  }

  StmtPtr parse_for() {
    auto stmt = node<Stmt>(Stmt::Kind::For, peek());
    expect_keyword("for"_kj);
    auto target = parse_or_expr();
    if (at_op(","_kj)) {
      auto tuple = node<Expr>(Expr::Kind::Tuple, peek());
      tuple->children.add(kj::mv(target));
      while (accept_op(","_kj)) {
        if (at_keyword("in"_kj)) {
          break;
        }
        tuple->children.add(parse_or_expr());
      }
      target = kj::mv(tuple);
    }
    check_assign_target(*target);
    stmt->target = kj::mv(target);
    expect_keyword("in"_kj);
    stmt->iter = parse_testlist();
    stmt->body = parse_suite();
    if (at_keyword("else"_kj)) {
      fail("for/else is not supported"_kj);
    }
    return stmt;
  }

  StmtPtr parse_def() {
    auto stmt = node<Stmt>(Stmt::Kind::FunctionDef, peek());
    expect_keyword("def"_kj);
    stmt->name = expect_identifier();
    expect_op("("_kj);
    bool seen_default = false;
    while (!at_op(")"_kj)) {
      Param param{expect_identifier(), kj::none};
      if (accept_op(":"_kj)) {
        (void)parse_test(); // annotation, ignored
      }
      if (accept_op("="_kj)) {
        param.default_value = parse_test();
        seen_default = true;
      } else if (seen_default) {
        fail("non-default argument follows default argument"_kj);
      }
      stmt->params.add(kj::mv(param));
      if (!accept_op(","_kj)) {
        break;
      }
    }
    expect_op(")"_kj);
    if (accept_op("->"_kj)) {
      (void)parse_test();
    }
    stmt->body = parse_suite();
    return stmt;
  }

  // ------------------------------------------------------------ expressions

  ExprPtr parse_testlist() {
    const Token& start = peek();
    auto first = parse_test();
    if (!at_op(","_kj)) {
      return first;
    }
    auto tuple = node<Expr>(Expr::Kind::Tuple, start);
    tuple->children.add(kj::mv(first));
    while (accept_op(","_kj)) {
      if (at(Token::Kind::Newline) || at(Token::Kind::EndOfFile) || at_op("="_kj) ||
          at_op(")"_kj)) {
        break;
      }
      tuple->children.add(parse_test());
    }
    return tuple;
  }

  ExprPtr parse_test() {
    if (at_keyword("lambda"_kj)) {
      fail("lambda expressions are not supported"_kj);
    }
    NestingGuard nested(*this);
    const Token& start = peek();
    auto body = parse_or_test();
    if (!at_keyword("if"_kj)) {
      return body;
    }
    next();
    auto cond = parse_or_test();
    expect_keyword("else"_kj);
    auto orelse = parse_test();
    auto expr = node<Expr>(Expr::Kind::IfExp, start);
    expr->children.add(kj::mv(body));
    expr->children.add(kj::mv(cond));
    expr->children.add(kj::mv(orelse));
    return expr;
  }

  ExprPtr parse_bool_chain(BoolOpKind kind, kj::StringPtr keyword, ExprPtr (Parser::*operand)()) {
    const Token& start = peek();
    auto first = (this->*operand)();
    if (!at_keyword(keyword)) {
      return first;
    }
    auto expr = node<Expr>(Expr::Kind::BoolOp, start);
    expr->bool_op = kind;
    expr->children.add(kj::mv(first));
    while (accept_keyword(keyword)) {
      expr->children.add((this->*operand)());
    }
    return expr;
  }

  ExprPtr parse_or_test() {
    return parse_bool_chain(BoolOpKind::Or, "or"_kj, &Parser::parse_and_test);
  }

  ExprPtr parse_and_test() {
    return parse_bool_chain(BoolOpKind::And, "and"_kj, &Parser::parse_not_test);
  }

  ExprPtr parse_not_test() {
    const Token& start = peek();
    if (accept_keyword("not"_kj)) {
      NestingGuard nested(*this);
      auto expr = node<Expr>(Expr::Kind::Unary, start);
      expr->unary_op = UnaryOp::Not;
      expr->children.add(parse_not_test());
      return expr;
    }
    return parse_comparison();
  }

  kj::Maybe<CompareOp> accept_compare_op() {
    static constexpr struct {
      kj::StringPtr text;
      CompareOp op;
    } kOps[] = {{"<"_kj, CompareOp::Lt},  {"<="_kj, CompareOp::LtE}, {">"_kj, CompareOp::Gt},
                {">="_kj, CompareOp::GtE}, {"=="_kj, CompareOp::Eq},  {"!="_kj, CompareOp::NotEq}};
    for (auto& entry : kOps) {
      if (accept_op(entry.text)) {
        return entry.op;
      }
    }
    if (at_keyword("in"_kj) || at_keyword("is"_kj) ||
        (at_keyword("not"_kj) && peek(1).kind == Token::Kind::Name && peek(1).text == "in"_kj)) {
      fail("membership and identity comparisons are not supported"_kj);
    }
    return kj::none;
  }

  ExprPtr parse_comparison() {
    const Token& start = peek();
    auto first = parse_or_expr();
    KJ_IF_SOME(op, accept_compare_op()) {
      auto expr = node<Expr>(Expr::Kind::Compare, start);
      expr->children.add(kj::mv(first));
      expr->compare_ops.add(op);
      expr->children.add(parse_or_expr());
      while (true) {
        KJ_IF_SOME(more, accept_compare_op()) {
          expr->compare_ops.add(more);
          expr->children.add(parse_or_expr());
        } else {
          break;
        }
      }
      return expr;
    }
    return first;
  }

  ExprPtr binary(const Token& start, BinaryOp op, ExprPtr left, ExprPtr right) {
    auto expr = node<Expr>(Expr::Kind::Binary, start);
    expr->binary_op = op;
    expr->children.add(kj::mv(left));
    expr->children.add(kj::mv(right));
    return expr;
  }

  ExprPtr parse_or_expr() {
    const Token& start = peek();
    auto left = parse_and_expr();
    NestingGuard chain(*this, false);
    while (accept_op("|"_kj)) {
      chain.enter();
      left = binary(start, BinaryOp::BitOr, kj::mv(left), parse_and_expr());
    }
    return left;
  }

  ExprPtr parse_and_expr() {
    const Token& start = peek();
    auto left = parse_arith();
    NestingGuard chain(*this, false);
    while (accept_op("&"_kj)) {
      chain.enter();
      left = binary(start, BinaryOp::BitAnd, kj::mv(left), parse_arith());
    }
    return left;
  }

  ExprPtr parse_arith() {
    const Token& start = peek();
    auto left = parse_term();
    NestingGuard chain(*this, false);
    while (true) {
      if (at_op("+"_kj) || at_op("-"_kj)) {
        chain.enter();
      }
      if (accept_op("+"_kj)) {
        left = binary(start, BinaryOp::Add, kj::mv(left), parse_term());
      } else if (accept_op("-"_kj)) {
        left = binary(start, BinaryOp::Sub, kj::mv(left), parse_term());
      } else {
        return left;
      }
    }
  }

  ExprPtr parse_term() {
    const Token& start = peek();
    auto left = parse_factor();
    NestingGuard chain(*this, false);
    while (true) {
      if (at_op("*"_kj) || at_op("/"_kj) || at_op("//"_kj) || at_op("%"_kj)) {
        chain.enter();
      }
      if (accept_op("*"_kj)) {
        left = binary(start, BinaryOp::Mul, kj::mv(left), parse_factor());
      } else if (accept_op("/"_kj)) {
        left = binary(start, BinaryOp::Div, kj::mv(left), parse_factor());
      } else if (accept_op("//"_kj)) {
        left = binary(start, BinaryOp::FloorDiv, kj::mv(left), parse_factor());
      } else if (accept_op("%"_kj)) {
        left = binary(start, BinaryOp::Mod, kj::mv(left), parse_factor());
      } else {
        return left;
      }
    }
  }

  ExprPtr parse_factor() {
    const Token& start = peek();
    kj::Maybe<UnaryOp> op;
    if (at_op("-"_kj)) {
      op = UnaryOp::Neg;
    } else if (at_op("+"_kj)) {
      op = UnaryOp::Pos;
    } else if (at_op("~"_kj)) {
      op = UnaryOp::Invert;
    }
    KJ_IF_SOME(unary, op) {
      NestingGuard nested(*this);
      next();
      auto expr = node<Expr>(Expr::Kind::Unary, start);
      expr->unary_op = unary;
      expr->children.add(parse_factor());
      return expr;
    }
    return parse_power();
  }

  ExprPtr parse_power() {
    const Token& start = peek();
    auto base = parse_atom_expr();
    if (accept_op("**"_kj)) {
      NestingGuard nested(*this);
      return binary(start, BinaryOp::Pow, kj::mv(base), parse_factor());
    }
    return base;
  }

  ExprPtr parse_atom_expr() {
    auto expr = parse_atom();
    NestingGuard chain(*this, false);
    while (true) {
      const Token& start = peek();
      if (at_op("("_kj) || at_op("["_kj) || at_op("."_kj)) {
        chain.enter();
      }
      if (accept_op("("_kj)) {
        auto call = node<Expr>(Expr::Kind::Call, start);
        call->line = expr->line;
        call->column = expr->column;
        call->children.add(kj::mv(expr));
        parse_call_arguments(*call);
        expr = kj::mv(call);
      } else if (accept_op("["_kj)) {
        auto sub = node<Expr>(Expr::Kind::Subscript, start);
        sub->line = expr->line;
        sub->column = expr->column;
        sub->children.add(kj::mv(expr));
        if (at_op(":"_kj)) {
          fail("slices are not supported"_kj);
        }
        sub->children.add(parse_test());
        if (at_op(":"_kj)) {
          fail("slices are not supported"_kj);
        }
        expect_op("]"_kj);
        expr = kj::mv(sub);
      } else if (accept_op("."_kj)) {
        auto attr = node<Expr>(Expr::Kind::Attribute, start);
        attr->line = expr->line;
        attr->column = expr->column;
        attr->children.add(kj::mv(expr));
        attr->text = expect_identifier();
        expr = kj::mv(attr);
      } else {
        return expr;
      }
    }
  }

  void parse_call_arguments(Expr& call) {
    while (!at_op(")"_kj)) {
      if (at_op("*"_kj) || at_op("**"_kj)) {
        fail("argument unpacking is not supported"_kj);
      }
      if (at(Token::Kind::Name) && peek(1).kind == Token::Kind::Op && peek(1).text == "="_kj) {
        auto name = expect_identifier();
        next(); // '='
        call.keywords.add(Keyword{kj::mv(name), parse_test()});
      } else {
        if (!call.keywords.empty()) {
          fail("positional argument follows keyword argument"_kj);
        }
        call.children.add(parse_test());
      }
      if (at_keyword("for"_kj)) {
        fail("comprehensions are not supported"_kj);
      }
      if (!accept_op(","_kj)) {
        break;
      }
    }
    expect_op(")"_kj);
  }

  ExprPtr parse_atom() {
    const Token& tok = peek();
    switch (tok.kind) {
    case Token::Kind::Number: {
      auto expr = node<Expr>(Expr::Kind::Number, tok);
      expr->number = tok.number;
      expr->is_integer = tok.is_integer;
      expr->text = kj::str(tok.text);
      next();
      return expr;
    }
    case Token::Kind::String: {
      auto expr = node<Expr>(Expr::Kind::String, tok);
      kj::String text = kj::str(tok.text);
      next();
      // Adjacent literals concatenate
      while (at(Token::Kind::String)) {
        text = kj::str(text, next().text);
      }
      expr->text = kj::mv(text);
      return expr;
    }
    case Token::Kind::Name: {
      if (tok.text == "True"_kj || tok.text == "False"_kj) {
        auto expr = node<Expr>(Expr::Kind::Bool, tok);
        expr->bool_value = tok.text == "True"_kj;
        next();
        return expr;
      }
      if (tok.text == "None"_kj) {
        auto expr = node<Expr>(Expr::Kind::NoneLiteral, tok);
        next();
        return expr;
      }
      if (is_reserved(tok.text)) {
        fail(kj::str("invalid syntax near '", tok.text, "'"));
      }
      auto expr = node<Expr>(Expr::Kind::Name, tok);
      expr->text = kj::str(tok.text);
      next();
      return expr;
    }
    case Token::Kind::Op:
      if (tok.text == "("_kj) {
        next();
        if (accept_op(")"_kj)) {
          return node<Expr>(Expr::Kind::Tuple, tok);
        }
        auto inner = parse_test();
        if (at_keyword("for"_kj)) {
          fail("comprehensions are not supported"_kj);
        }
        if (at_op(","_kj)) {
          auto tuple = node<Expr>(Expr::Kind::Tuple, tok);
          tuple->children.add(kj::mv(inner));
          while (accept_op(","_kj)) {
            if (at_op(")"_kj)) {
              break;
            }
            tuple->children.add(parse_test());
          }
          inner = kj::mv(tuple);
        }
        expect_op(")"_kj);
        return inner;
      }
      if (tok.text == "["_kj) {
        next();
        auto list = node<Expr>(Expr::Kind::List, tok);
        while (!at_op("]"_kj)) {
          list->children.add(parse_test());
          if (at_keyword("for"_kj)) {
            fail("comprehensions are not supported"_kj);
          }
          if (!accept_op(","_kj)) {
            break;
          }
        }
        expect_op("]"_kj);
        return list;
      }
      if (tok.text == "{"_kj) {
        fail("dict and set literals are not supported"_kj);
      }
      break;
    default:
      break;
    }
    fail_unexpected();
  }
};

void check_source_size(kj::StringPtr source) {
  if (source.size() > kMaxSourceBytes) {
    throw SyntaxErrorException(kj::str("source exceeds ", kMaxSourceBytes, " bytes"), 1, 0);
  }
}

} // namespace

ParseResult parse(kj::StringPtr source) {
  try {
    check_source_size(source);
    Parser parser(tokenize(source));
    return parser.parse_module();
  } catch (const SyntaxErrorException& e) {
    return SyntaxError{kj::str(e.reason()), e.error_line(), e.error_column()};
  }
}

Module parse_or_throw(kj::StringPtr source) {
  check_source_size(source);
  Parser parser(tokenize(source));
  return parser.parse_module();
}

kj::Maybe<SyntaxError> check_syntax(kj::StringPtr source) {
  auto result = parse(source);
  KJ_IF_SOME(error, result.tryGet<SyntaxError>()) {
    return kj::mv(error);
  }
  return kj::none;
}

} // namespace evoguard::snippet
