#include "evoguard/security/ast_validator.h"

#include "evoguard/security/security_validator.h"
#include "evoguard/snippet/parser.h"
#include "evoguard/snippet/printer.h"

#include <kj/one-of.h>

namespace evoguard::security {

namespace {

constexpr kj::StringPtr kIntrospectionNames[] = {"globals"_kj,      "locals"_kj,  "vars"_kj,
                                                 "__builtins__"_kj, "getattr"_kj, "setattr"_kj,
                                                 "delattr"_kj};

bool is_dunder(kj::StringPtr name) {
  return name.size() > 4 && name.startsWith("__") && name.endsWith("__");
}

bool is_constant_true(const snippet::Expr& test) {
  using Kind = snippet::Expr::Kind;
  if (test.kind == Kind::Bool) {
    return test.bool_value;
  }
  if (test.kind == Kind::Number) {
    return test.number != 0.0;
  }
  return false;
}

// Break statements that exit this loop; nested loops and functions own theirs
bool has_break(const kj::Vector<snippet::StmtPtr>& body) {
  using Kind = snippet::Stmt::Kind;
  for (auto& stmt : body) {
    switch (stmt->kind) {
    case Kind::Break:
    case Kind::Return:
      return true;
    case Kind::If:
      if (has_break(stmt->body) || has_break(stmt->orelse)) {
        return true;
      }
      break;
    default:
      break;
    }
  }
  return false;
}

} // namespace

bool ASTValidator::is_forbidden_name(kj::StringPtr name) {
  if (SecurityValidator::is_forbidden_call(name)) {
    return true;
  }
  for (auto n : kIntrospectionNames) {
    if (n == name) {
      return true;
    }
  }
  return false;
}

ValidationResult ASTValidator::validate(kj::StringPtr code) const {
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

ValidationResult ASTValidator::validate(const snippet::Module& module) const {
  ValidationResult result;

  snippet::for_each_stmt(module, [&](const snippet::Stmt& stmt) {
    switch (stmt.kind) {
    case snippet::Stmt::Kind::Import:
    case snippet::Stmt::Kind::ImportFrom:
      result.add_error(kj::str("Import statement not allowed at line ", stmt.line));
      break;
    case snippet::Stmt::Kind::FunctionDef:
      if (is_forbidden_name(stmt.name)) {
        result.add_error(kj::str("Forbidden name: ", stmt.name, " at line ", stmt.line));
      }
      break;
    case snippet::Stmt::Kind::While: {
      auto& test = KJ_ASSERT_NONNULL(stmt.test);
      if (is_constant_true(*test) && !has_break(stmt.body)) {
        result.add_error(kj::str("Infinite loop: while ", snippet::print(*test),
                                 " without break at line ", stmt.line));
      } else {
        result.add_warning(kj::str("while loop at line ", stmt.line, " may not terminate"));
      }
      break;
    }
    default:
      break;
    }
  });

  snippet::for_each_expr(module, [&](const snippet::Expr& expr) {
    if (expr.kind == snippet::Expr::Kind::Name && is_forbidden_name(expr.text)) {
      result.add_error(kj::str("Forbidden name: ", expr.text, " at line ", expr.line));
    } else if (expr.kind == snippet::Expr::Kind::Attribute && is_dunder(expr.text)) {
      result.add_error(kj::str("Forbidden attribute access: ", expr.text, " at line ", expr.line));
    }
  });

  return result;
}

bool ASTValidator::validate_fast(kj::StringPtr code) const {
  auto parsed = snippet::parse(code);
  KJ_IF_SOME(module, parsed.tryGet<snippet::Module>()) {
    bool clean = true;
    snippet::for_each_stmt(module, [&](const snippet::Stmt& stmt) {
      if (stmt.kind == snippet::Stmt::Kind::Import ||
          stmt.kind == snippet::Stmt::Kind::ImportFrom) {
        clean = false;
      }
    });
    if (!clean) {
      return false;
    }
    snippet::for_each_expr(module, [&](const snippet::Expr& expr) {
      if ((expr.kind == snippet::Expr::Kind::Name && is_forbidden_name(expr.text)) ||
          (expr.kind == snippet::Expr::Kind::Attribute && is_dunder(expr.text))) {
        clean = false;
      }
    });
    return clean;
  }
  return false;
}

} // namespace evoguard::security
