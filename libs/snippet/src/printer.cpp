#include "evoguard/snippet/printer.h"

#include <charconv>
#include <cmath>
#include <kj/debug.h>
#include <kj/string-tree.h>

namespace evoguard::snippet {

namespace {

enum Precedence : int {
  kIfExp = 1,
  kOr = 2,
  kAnd = 3,
  kNot = 4,
  kCompare = 5,
  kBitOr = 6,
  kBitAnd = 8,
  kArith = 10,
  kTerm = 11,
  kUnary = 12,
  kPower = 13,
  kAtom = 14,
};

int binary_precedence(BinaryOp op) {
  switch (op) {
  case BinaryOp::BitOr:
    return kBitOr;
  case BinaryOp::BitAnd:
    return kBitAnd;
  case BinaryOp::Add:
  case BinaryOp::Sub:
    return kArith;
  case BinaryOp::Mul:
  case BinaryOp::Div:
  case BinaryOp::FloorDiv:
  case BinaryOp::Mod:
    return kTerm;
  case BinaryOp::Pow:
    return kPower;
  }
  KJ_UNREACHABLE;
}

int precedence(const Expr& expr) {
  switch (expr.kind) {
  case Expr::Kind::IfExp:
    return kIfExp;
  case Expr::Kind::BoolOp:
    return expr.bool_op == BoolOpKind::Or ? kOr : kAnd;
  case Expr::Kind::Unary:
    return expr.unary_op == UnaryOp::Not ? kNot : kUnary;
  case Expr::Kind::Compare:
    return kCompare;
  case Expr::Kind::Binary:
    return binary_precedence(expr.binary_op);
  case Expr::Kind::Number:
    return expr.number < 0 ? kUnary : kAtom;
  default:
    return kAtom;
  }
}

kj::String quote(kj::StringPtr text) {
  kj::Vector<char> out;
  out.add('\'');
  for (char c : text) {
    switch (c) {
    case '\\':
      out.addAll("\\\\"_kj);
      break;
    case '\'':
      out.addAll("\\'"_kj);
      break;
    case '\n':
      out.addAll("\\n"_kj);
      break;
    case '\t':
      out.addAll("\\t"_kj);
      break;
    default:
      out.add(c);
    }
  }
  out.add('\'');
  return kj::heapString(out.begin(), out.size());
}

kj::StringTree print_expr(const Expr& expr, int required);

kj::String indentation(int indent) {
  auto out = kj::heapString(static_cast<size_t>(indent) * 4);
  for (auto& c : out) {
    c = ' ';
  }
  return out;
}

kj::StringTree print_list(const kj::Vector<ExprPtr>& items, size_t from = 0) {
  kj::Vector<kj::StringTree> parts;
  for (size_t i = from; i < items.size(); ++i) {
    parts.add(print_expr(*items[i], kIfExp));
  }
  return kj::StringTree(parts.releaseAsArray(), ", "_kj);
}

kj::StringTree print_unparenthesized(const Expr& expr) {
  switch (expr.kind) {
  case Expr::Kind::Number:
    if (expr.text.size() > 0) {
      return kj::strTree(expr.text);
    }
    return kj::strTree(format_number(expr.number, expr.is_integer));
  case Expr::Kind::String:
    return kj::strTree(quote(expr.text));
  case Expr::Kind::Bool:
    return kj::strTree(expr.bool_value ? "True"_kj : "False"_kj);
  case Expr::Kind::NoneLiteral:
    return kj::strTree("None"_kj);
  case Expr::Kind::Name:
    return kj::strTree(expr.text);
  case Expr::Kind::Attribute:
    return kj::strTree(print_expr(*expr.children[0], kAtom), ".", expr.text);
  case Expr::Kind::Call: {
    kj::Vector<kj::StringTree> args;
    for (size_t i = 1; i < expr.children.size(); ++i) {
      args.add(print_expr(*expr.children[i], kIfExp));
    }
    for (auto& kw : expr.keywords) {
      args.add(kj::strTree(kw.name, "=", print_expr(*kw.value, kIfExp)));
    }
    return kj::strTree(print_expr(*expr.children[0], kAtom), "(",
                       kj::StringTree(args.releaseAsArray(), ", "_kj), ")");
  }
  case Expr::Kind::Subscript:
    return kj::strTree(print_expr(*expr.children[0], kAtom), "[",
                       print_expr(*expr.children[1], kIfExp), "]");
  case Expr::Kind::Unary: {
    int prec = precedence(expr);
    if (expr.unary_op == UnaryOp::Not) {
      return kj::strTree("not ", print_expr(*expr.children[0], prec));
    }
    return kj::strTree(to_string(expr.unary_op), print_expr(*expr.children[0], prec));
  }
  case Expr::Kind::Binary: {
    int prec = precedence(expr);
    if (expr.binary_op == BinaryOp::Pow) {
      return kj::strTree(print_expr(*expr.children[0], kAtom), " ** ",
                         print_expr(*expr.children[1], kUnary));
    }
    return kj::strTree(print_expr(*expr.children[0], prec), " ", to_string(expr.binary_op), " ",
                       print_expr(*expr.children[1], prec + 1));
  }
  case Expr::Kind::Compare: {
    auto out = print_expr(*expr.children[0], kCompare + 1);
    for (size_t i = 0; i < expr.compare_ops.size(); ++i) {
      out = kj::strTree(kj::mv(out), " ", to_string(expr.compare_ops[i]), " ",
                        print_expr(*expr.children[i + 1], kCompare + 1));
    }
    return out;
  }
  case Expr::Kind::BoolOp: {
    int prec = precedence(expr);
    kj::Vector<kj::StringTree> parts;
    for (auto& child : expr.children) {
      parts.add(print_expr(*child, prec + 1));
    }
    auto sep = kj::str(" ", to_string(expr.bool_op), " ");
    return kj::StringTree(parts.releaseAsArray(), sep);
  }
  case Expr::Kind::IfExp:
    return kj::strTree(print_expr(*expr.children[0], kOr), " if ",
                       print_expr(*expr.children[1], kOr), " else ",
                       print_expr(*expr.children[2], kIfExp));
  case Expr::Kind::List:
    return kj::strTree("[", print_list(expr.children), "]");
  case Expr::Kind::Tuple:
    if (expr.children.size() == 1) {
      return kj::strTree("(", print_expr(*expr.children[0], kIfExp), ",)");
    }
    return kj::strTree("(", print_list(expr.children), ")");
  }
  KJ_UNREACHABLE;
}

kj::StringTree print_expr(const Expr& expr, int required) {
  if (precedence(expr) < required) {
    return kj::strTree("(", print_unparenthesized(expr), ")");
  }
  return print_unparenthesized(expr);
}

kj::StringTree print_body(const kj::Vector<StmtPtr>& body, int indent);

kj::StringTree print_stmt(const Stmt& stmt, int indent) {
  auto pad = indentation(indent);
  auto expr_of = [](const kj::Maybe<ExprPtr>& maybe) -> kj::StringTree {
    KJ_IF_SOME(expr, maybe) {
      return print_expr(*expr, kIfExp);
    }
    return kj::StringTree();
  };

  switch (stmt.kind) {
  case Stmt::Kind::ExprStmt:
    return kj::strTree(pad, expr_of(stmt.value), "\n");
  case Stmt::Kind::Assign:
    return kj::strTree(pad, expr_of(stmt.target), " = ", expr_of(stmt.value), "\n");
  case Stmt::Kind::AugAssign:
    return kj::strTree(pad, expr_of(stmt.target), " ", to_string(stmt.aug_op), "= ",
                       expr_of(stmt.value), "\n");
  case Stmt::Kind::Import:
  case Stmt::Kind::ImportFrom: {
    kj::Vector<kj::StringTree> names;
    for (auto& alias : stmt.aliases) {
      KJ_IF_SOME(as, alias.as_name) {
        names.add(kj::strTree(alias.name, " as ", as));
      } else {
        names.add(kj::strTree(alias.name));
      }
    }
    auto list = kj::StringTree(names.releaseAsArray(), ", "_kj);
    if (stmt.kind == Stmt::Kind::Import) {
      return kj::strTree(pad, "import ", kj::mv(list), "\n");
    }
    return kj::strTree(pad, "from ", stmt.name, " import ", kj::mv(list), "\n");
  }
  case Stmt::Kind::FunctionDef: {
    kj::Vector<kj::StringTree> params;
    for (auto& param : stmt.params) {
      KJ_IF_SOME(def, param.default_value) {
        params.add(kj::strTree(param.name, "=", print_expr(*def, kIfExp)));
      } else {
        params.add(kj::strTree(param.name));
      }
    }
    return kj::strTree(pad, "def ", stmt.name, "(",
                       kj::StringTree(params.releaseAsArray(), ", "_kj), "):\n",
                       print_body(stmt.body, indent + 1));
  }
  case Stmt::Kind::Return:
    if (stmt.value == kj::none) {
      return kj::strTree(pad, "return\n");
    }
    return kj::strTree(pad, "return ", expr_of(stmt.value), "\n");
  case Stmt::Kind::If: {
    auto out = kj::strTree(pad, "if ", expr_of(stmt.test), ":\n", print_body(stmt.body, indent + 1));
    const Stmt* cur = &stmt;
    // Collapse else-if chains into elif
    while (cur->orelse.size() == 1 && cur->orelse[0]->kind == Stmt::Kind::If) {
      cur = cur->orelse[0].get();
      out = kj::strTree(kj::mv(out), pad, "elif ", expr_of(cur->test), ":\n",
                        print_body(cur->body, indent + 1));
    }
    if (cur->orelse.size() > 0) {
      out = kj::strTree(kj::mv(out), pad, "else:\n", print_body(cur->orelse, indent + 1));
    }
    return out;
  }
  case Stmt::Kind::While:
    return kj::strTree(pad, "while ", expr_of(stmt.test), ":\n", print_body(stmt.body, indent + 1));
  case Stmt::Kind::For:
    return kj::strTree(pad, "for ", expr_of(stmt.target), " in ", expr_of(stmt.iter), ":\n",
                       print_body(stmt.body, indent + 1));
  case Stmt::Kind::Pass:
    return kj::strTree(pad, "pass\n");
  case Stmt::Kind::Break:
    return kj::strTree(pad, "break\n");
  case Stmt::Kind::Continue:
    return kj::strTree(pad, "continue\n");
  }
  KJ_UNREACHABLE;
}

kj::StringTree print_body(const kj::Vector<StmtPtr>& body, int indent) {
  if (body.empty()) {
    return kj::strTree(indentation(indent), "pass\n");
  }
  kj::Vector<kj::StringTree> parts;
  for (auto& stmt : body) {
    parts.add(print_stmt(*stmt, indent));
  }
  return kj::StringTree(parts.releaseAsArray(), ""_kj);
}

} // namespace

kj::String format_number(double value, bool is_integer) {
  if (is_integer && std::isfinite(value) && std::fabs(value) < 9.0e15) {
    return kj::str(static_cast<int64_t>(std::llround(value)));
  }
  if (std::isnan(value)) {
    return kj::str("float('nan')");
  }
  if (std::isinf(value)) {
    return kj::str(value < 0 ? "float('-inf')" : "float('inf')");
  }
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  KJ_ASSERT(ec == std::errc(), "number formatting failed");
  kj::String text = kj::heapString(buf, static_cast<size_t>(end - buf));
  // Keep floats visibly floats so they re-parse as such
  bool has_marker = false;
  for (char c : text) {
    if (c == '.' || c == 'e' || c == 'E') {
      has_marker = true;
      break;
    }
  }
  return has_marker ? kj::mv(text) : kj::str(text, ".0");
}

kj::String print(const Module& module) {
  kj::Vector<kj::StringTree> parts;
  for (auto& stmt : module.body) {
    parts.add(print_stmt(*stmt, 0));
  }
  return kj::StringTree(parts.releaseAsArray(), ""_kj).flatten();
}

kj::String print(const Stmt& stmt, int indent) {
  return print_stmt(stmt, indent).flatten();
}

kj::String print(const Expr& expr) {
  return print_expr(expr, 0).flatten();
}

} // namespace evoguard::snippet
