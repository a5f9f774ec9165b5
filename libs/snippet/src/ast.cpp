#include "evoguard/snippet/ast.h"

namespace evoguard::snippet {

kj::StringPtr to_string(UnaryOp op) {
  switch (op) {
  case UnaryOp::Neg:
    return "-"_kj;
  case UnaryOp::Pos:
    return "+"_kj;
  case UnaryOp::Not:
    return "not"_kj;
  case UnaryOp::Invert:
    return "~"_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr to_string(BinaryOp op) {
  switch (op) {
  case BinaryOp::Add:
    return "+"_kj;
  case BinaryOp::Sub:
    return "-"_kj;
  case BinaryOp::Mul:
    return "*"_kj;
  case BinaryOp::Div:
    return "/"_kj;
  case BinaryOp::FloorDiv:
    return "//"_kj;
  case BinaryOp::Mod:
    return "%"_kj;
  case BinaryOp::Pow:
    return "**"_kj;
  case BinaryOp::BitAnd:
    return "&"_kj;
  case BinaryOp::BitOr:
    return "|"_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr to_string(CompareOp op) {
  switch (op) {
  case CompareOp::Lt:
    return "<"_kj;
  case CompareOp::LtE:
    return "<="_kj;
  case CompareOp::Gt:
    return ">"_kj;
  case CompareOp::GtE:
    return ">="_kj;
  case CompareOp::Eq:
    return "=="_kj;
  case CompareOp::NotEq:
    return "!="_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr to_string(BoolOpKind op) {
  return op == BoolOpKind::And ? "and"_kj : "or"_kj;
}

ExprPtr make_number(double value, bool is_integer, int line, int column) {
  auto expr = kj::heap<Expr>(Expr::Kind::Number);
  expr->number = value;
  expr->is_integer = is_integer;
  expr->line = line;
  expr->column = column;
  return expr;
}

ExprPtr make_name(kj::StringPtr name, int line, int column) {
  auto expr = kj::heap<Expr>(Expr::Kind::Name);
  expr->text = kj::str(name);
  expr->line = line;
  expr->column = column;
  return expr;
}

// ============================================================================
// Cloning
// ============================================================================

namespace {

kj::Maybe<ExprPtr> clone_maybe(const kj::Maybe<ExprPtr>& maybe) {
  KJ_IF_SOME(expr, maybe) {
    return clone(*expr);
  }
  return kj::none;
}

kj::Vector<StmtPtr> clone_body(const kj::Vector<StmtPtr>& body) {
  kj::Vector<StmtPtr> out(body.size());
  for (auto& stmt : body) {
    out.add(clone(*stmt));
  }
  return out;
}

} // namespace

ExprPtr clone(const Expr& expr) {
  auto out = kj::heap<Expr>(expr.kind);
  out->line = expr.line;
  out->column = expr.column;
  out->number = expr.number;
  out->is_integer = expr.is_integer;
  out->bool_value = expr.bool_value;
  out->text = kj::str(expr.text);
  out->unary_op = expr.unary_op;
  out->binary_op = expr.binary_op;
  out->bool_op = expr.bool_op;
  for (auto op : expr.compare_ops) {
    out->compare_ops.add(op);
  }
  for (auto& child : expr.children) {
    out->children.add(clone(*child));
  }
  for (auto& kw : expr.keywords) {
    out->keywords.add(Keyword{kj::str(kw.name), clone(*kw.value)});
  }
  return out;
}

StmtPtr clone(const Stmt& stmt) {
  auto out = kj::heap<Stmt>(stmt.kind);
  out->line = stmt.line;
  out->name = kj::str(stmt.name);
  for (auto& alias : stmt.aliases) {
    ImportAlias copy{kj::str(alias.name), kj::none};
    KJ_IF_SOME(as, alias.as_name) {
      copy.as_name = kj::str(as);
    }
    out->aliases.add(kj::mv(copy));
  }
  for (auto& param : stmt.params) {
    out->params.add(Param{kj::str(param.name), clone_maybe(param.default_value)});
  }
  out->target = clone_maybe(stmt.target);
  out->value = clone_maybe(stmt.value);
  out->test = clone_maybe(stmt.test);
  out->iter = clone_maybe(stmt.iter);
  out->aug_op = stmt.aug_op;
  out->body = clone_body(stmt.body);
  out->orelse = clone_body(stmt.orelse);
  return out;
}

Module clone(const Module& module) {
  Module out;
  out.body = clone_body(module.body);
  return out;
}

// ============================================================================
// Traversal
// ============================================================================

namespace {

template <typename E, typename Fn> void visit_expr(E& expr, Fn& fn) {
  fn(expr);
  for (auto& child : expr.children) {
    visit_expr(*child, fn);
  }
  for (auto& kw : expr.keywords) {
    visit_expr(*kw.value, fn);
  }
}

template <typename E, typename Fn> void visit_maybe(kj::Maybe<kj::Own<E>>& maybe, Fn& fn) {
  KJ_IF_SOME(expr, maybe) {
    visit_expr(*expr, fn);
  }
}

template <typename E, typename Fn> void visit_maybe(const kj::Maybe<kj::Own<E>>& maybe, Fn& fn) {
  KJ_IF_SOME(expr, maybe) {
    visit_expr(static_cast<const Expr&>(*expr), fn);
  }
}

template <typename S, typename Fn> void visit_stmt_exprs(S& stmt, Fn& fn) {
  for (auto& param : stmt.params) {
    visit_maybe(param.default_value, fn);
  }
  visit_maybe(stmt.target, fn);
  visit_maybe(stmt.value, fn);
  visit_maybe(stmt.test, fn);
  visit_maybe(stmt.iter, fn);
  for (auto& child : stmt.body) {
    visit_stmt_exprs(*child, fn);
  }
  for (auto& child : stmt.orelse) {
    visit_stmt_exprs(*child, fn);
  }
}

template <typename Fn> void visit_stmt(const Stmt& stmt, Fn& fn) {
  fn(stmt);
  for (auto& child : stmt.body) {
    visit_stmt(*child, fn);
  }
  for (auto& child : stmt.orelse) {
    visit_stmt(*child, fn);
  }
}

} // namespace

void for_each_expr(const Module& module, kj::FunctionParam<void(const Expr&)> fn) {
  for (auto& stmt : module.body) {
    visit_stmt_exprs(static_cast<const Stmt&>(*stmt), fn);
  }
}

void for_each_expr(const Stmt& stmt, kj::FunctionParam<void(const Expr&)> fn) {
  visit_stmt_exprs(stmt, fn);
}

void for_each_expr(const Expr& expr, kj::FunctionParam<void(const Expr&)> fn) {
  visit_expr(expr, fn);
}

void for_each_expr_mut(Module& module, kj::FunctionParam<void(Expr&)> fn) {
  for (auto& stmt : module.body) {
    visit_stmt_exprs(*stmt, fn);
  }
}

void for_each_expr_mut(Stmt& stmt, kj::FunctionParam<void(Expr&)> fn) {
  visit_stmt_exprs(stmt, fn);
}

void for_each_stmt(const Module& module, kj::FunctionParam<void(const Stmt&)> fn) {
  for (auto& stmt : module.body) {
    visit_stmt(*stmt, fn);
  }
}

void for_each_stmt(const Stmt& stmt, kj::FunctionParam<void(const Stmt&)> fn) {
  visit_stmt(stmt, fn);
}

kj::Maybe<const Stmt&> find_function(const Module& module, kj::StringPtr name) {
  for (auto& stmt : module.body) {
    if (stmt->kind == Stmt::Kind::FunctionDef && stmt->name == name) {
      return *stmt;
    }
  }
  return kj::none;
}

} // namespace evoguard::snippet
