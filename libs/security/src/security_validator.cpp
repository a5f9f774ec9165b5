#include "evoguard/security/security_validator.h"

#include "evoguard/core/error.h"
#include "evoguard/snippet/parser.h"

#include <kj/one-of.h>

namespace evoguard::security {

namespace {

constexpr kj::StringPtr kForbiddenCalls[] = {"eval"_kj, "exec"_kj, "compile"_kj, "__import__"_kj,
                                             "open"_kj};

// Literal period of a shift call, seeing through unary +/-
kj::Maybe<double> literal_value(const snippet::Expr& expr) {
  using Kind = snippet::Expr::Kind;
  if (expr.kind == Kind::Number) {
    return expr.number;
  }
  if (expr.kind == Kind::Unary && expr.children.size() == 1) {
    KJ_IF_SOME(inner, literal_value(*expr.children[0])) {
      if (expr.unary_op == snippet::UnaryOp::Neg) {
        return -inner;
      }
      if (expr.unary_op == snippet::UnaryOp::Pos) {
        return inner;
      }
    }
  }
  return kj::none;
}

kj::Maybe<kj::StringPtr> callee_name(const snippet::Expr& call) {
  auto& callee = *call.children[0];
  if (callee.kind == snippet::Expr::Kind::Name || callee.kind == snippet::Expr::Kind::Attribute) {
    return callee.text.asPtr();
  }
  return kj::none;
}

kj::Maybe<const snippet::Expr&> shift_period(const snippet::Expr& call) {
  if (call.children.size() > 1) {
    return *call.children[1];
  }
  for (auto& kw : call.keywords) {
    if (kw.name == "periods"_kj) {
      return *kw.value;
    }
  }
  return kj::none;
}

} // namespace

kj::ArrayPtr<const kj::StringPtr> SecurityValidator::forbidden_calls() {
  return kj::arrayPtr(kForbiddenCalls, kj::size(kForbiddenCalls));
}

bool SecurityValidator::is_forbidden_call(kj::StringPtr name) {
  for (auto f : kForbiddenCalls) {
    if (f == name) {
      return true;
    }
  }
  return false;
}

ValidationResult SecurityValidator::validate(kj::StringPtr code) const {
  auto parsed = snippet::parse(code);
  KJ_SWITCH_ONEOF(parsed) {
    KJ_CASE_ONEOF(error, snippet::SyntaxError) {
      return ValidationResult::failure(
          kj::str("Syntax error: ", error.message, " at line ", error.line));
    }
    KJ_CASE_ONEOF(module, snippet::Module) {
      return validate(module);
    }
  }
  KJ_UNREACHABLE;
}

ValidationResult SecurityValidator::validate(const snippet::Module& module) const {
  ValidationResult result;

  snippet::for_each_stmt(module, [&](const snippet::Stmt& stmt) {
    if (stmt.kind == snippet::Stmt::Kind::Import || stmt.kind == snippet::Stmt::Kind::ImportFrom) {
      result.add_error(kj::str("Import statement not allowed at line ", stmt.line));
    }
  });

  snippet::for_each_expr(module, [&](const snippet::Expr& expr) {
    if (expr.kind != snippet::Expr::Kind::Call) {
      return;
    }
    KJ_IF_SOME(name, callee_name(expr)) {
      if (is_forbidden_call(name)) {
        result.add_error(kj::str("Forbidden function call: ", name, " at line ", expr.line));
        return;
      }
      if (name != "shift"_kj) {
        return;
      }
      KJ_IF_SOME(period, shift_period(expr)) {
        KJ_IF_SOME(value, literal_value(period)) {
          if (value < 0) {
            result.add_error(
                kj::str("Negative shift not allowed (look-ahead bias) at line ", expr.line));
          } else if (value == 0) {
            result.add_error(kj::str("Zero shift not allowed at line ", expr.line));
          }
        }
      }
    }
  });

  return result;
}

void SecurityValidator::require_safe(kj::StringPtr code) const {
  auto result = validate(code);
  if (!result.success) {
    throw core::PolicyViolation(result.summary());
  }
}

} // namespace evoguard::security
