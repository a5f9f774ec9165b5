/**
 * @file ast.h
 * @brief Typed syntax tree for strategy snippets
 *
 * Snippets use a small Python-compatible grammar. The tree is plain data:
 * mutators clone and rewrite it, the printer turns it back into source, and
 * the Interpreter evaluates it. Nothing is ever compiled to host code.
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::snippet {

enum class UnaryOp : uint8_t { Neg, Pos, Not, Invert };
enum class BinaryOp : uint8_t { Add, Sub, Mul, Div, FloorDiv, Mod, Pow, BitAnd, BitOr };
enum class CompareOp : uint8_t { Lt, LtE, Gt, GtE, Eq, NotEq };
enum class BoolOpKind : uint8_t { And, Or };

[[nodiscard]] kj::StringPtr to_string(UnaryOp op);
[[nodiscard]] kj::StringPtr to_string(BinaryOp op);
[[nodiscard]] kj::StringPtr to_string(CompareOp op);
[[nodiscard]] kj::StringPtr to_string(BoolOpKind op);

struct Expr;
struct Stmt;
using ExprPtr = kj::Own<Expr>;
using StmtPtr = kj::Own<Stmt>;

struct Keyword {
  kj::String name;
  ExprPtr value;
};

/**
 * @brief Expression node
 *
 * Field use by kind:
 *   Number     number, is_integer, text (source spelling)
 *   String     text
 *   Bool       bool_value
 *   Name       text
 *   Attribute  children[0] object, text attribute name
 *   Call       children[0] callee, children[1..] positional args, keywords
 *   Subscript  children[0] object, children[1] index
 *   Unary      unary_op, children[0]
 *   Binary     binary_op, children[0..1]
 *   Compare    children[0] left, compare_ops[i] between children[i] and children[i+1]
 *   BoolOp     bool_op, children (two or more)
 *   IfExp      children[0] body, children[1] test, children[2] orelse
 *   List/Tuple children
 */
struct Expr {
  enum class Kind : uint8_t {
    Number,
    String,
    Bool,
    NoneLiteral,
    Name,
    Attribute,
    Call,
    Subscript,
    Unary,
    Binary,
    Compare,
    BoolOp,
    IfExp,
    List,
    Tuple,
  };

  Kind kind;
  int line = 0;
  int column = 0;

  double number = 0.0;
  bool is_integer = false;
  bool bool_value = false;
  kj::String text;

  UnaryOp unary_op = UnaryOp::Neg;
  BinaryOp binary_op = BinaryOp::Add;
  BoolOpKind bool_op = BoolOpKind::And;
  kj::Vector<CompareOp> compare_ops;

  kj::Vector<ExprPtr> children;
  kj::Vector<Keyword> keywords;

  explicit Expr(Kind k) : kind(k) {}
};

struct Param {
  kj::String name;
  kj::Maybe<ExprPtr> default_value;
};

struct ImportAlias {
  kj::String name;
  kj::Maybe<kj::String> as_name;
};

/**
 * @brief Statement node
 *
 * Field use by kind:
 *   ExprStmt     value
 *   Assign       target, value
 *   AugAssign    target, value, aug_op
 *   Import       aliases
 *   ImportFrom   name (module), aliases
 *   FunctionDef  name, params, body
 *   Return       value (optional)
 *   If           test, body, orelse (elif is a nested If in orelse)
 *   While        test, body
 *   For          target, iter, body
 *   Pass/Break/Continue
 */
struct Stmt {
  enum class Kind : uint8_t {
    ExprStmt,
    Assign,
    AugAssign,
    Import,
    ImportFrom,
    FunctionDef,
    Return,
    If,
    While,
    For,
    Pass,
    Break,
    Continue,
  };

  Kind kind;
  int line = 0;

  kj::String name;
  kj::Vector<ImportAlias> aliases;
  kj::Vector<Param> params;

  kj::Maybe<ExprPtr> target;
  kj::Maybe<ExprPtr> value;
  kj::Maybe<ExprPtr> test;
  kj::Maybe<ExprPtr> iter;
  BinaryOp aug_op = BinaryOp::Add;

  kj::Vector<StmtPtr> body;
  kj::Vector<StmtPtr> orelse;

  explicit Stmt(Kind k) : kind(k) {}
};

struct Module {
  kj::Vector<StmtPtr> body;
};

// Construction helpers
ExprPtr make_number(double value, bool is_integer, int line = 0, int column = 0);
ExprPtr make_name(kj::StringPtr name, int line = 0, int column = 0);

// Deep copies
[[nodiscard]] ExprPtr clone(const Expr& expr);
[[nodiscard]] StmtPtr clone(const Stmt& stmt);
[[nodiscard]] Module clone(const Module& module);

/**
 * @brief Pre-order traversal of every expression reachable from a node
 */
void for_each_expr(const Module& module, kj::FunctionParam<void(const Expr&)> fn);
void for_each_expr(const Stmt& stmt, kj::FunctionParam<void(const Expr&)> fn);
void for_each_expr(const Expr& expr, kj::FunctionParam<void(const Expr&)> fn);

/// Mutable variant used by the tree rewriters
void for_each_expr_mut(Module& module, kj::FunctionParam<void(Expr&)> fn);
void for_each_expr_mut(Stmt& stmt, kj::FunctionParam<void(Expr&)> fn);

/**
 * @brief Pre-order traversal of every statement, nested bodies included
 */
void for_each_stmt(const Module& module, kj::FunctionParam<void(const Stmt&)> fn);
void for_each_stmt(const Stmt& stmt, kj::FunctionParam<void(const Stmt&)> fn);

/// First top-level FunctionDef with the given name
[[nodiscard]] kj::Maybe<const Stmt&> find_function(const Module& module, kj::StringPtr name);

} // namespace evoguard::snippet
