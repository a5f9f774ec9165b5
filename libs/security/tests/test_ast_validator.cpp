#include "evoguard/security/ast_validator.h"
#include "kj/test.h"

using namespace evoguard::security;

namespace {

KJ_TEST("ASTValidator: Forbidden names are rejected even without a call") {
  ASTValidator validator;
  auto result = validator.validate("f = eval\n"_kj);
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.first_error().startsWith("Forbidden name: eval"), result.summary());

  KJ_EXPECT(!validator.validate("g = globals()\n"_kj).success);
  KJ_EXPECT(!validator.validate("h = getattr(x, 'y')\n"_kj).success);
}

KJ_TEST("ASTValidator: Dunder attribute access is rejected") {
  ASTValidator validator;
  auto result = validator.validate("c = x.__class__\n"_kj);
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.first_error().startsWith("Forbidden attribute access"), result.summary());
}

KJ_TEST("ASTValidator: Constant loop without break is an infinite loop") {
  ASTValidator validator;
  auto result = validator.validate("while True:\n"
                                   "    x = 1\n"_kj);
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.first_error().startsWith("Infinite loop"), result.summary());
}

KJ_TEST("ASTValidator: Loops that can exit only warn") {
  ASTValidator validator;
  auto with_break = validator.validate("while True:\n"
                                       "    if x > 3:\n"
                                       "        break\n"_kj);
  KJ_EXPECT(with_break.success, with_break.summary());
  KJ_EXPECT(with_break.warnings.size() == 1);

  auto conditional = validator.validate("while n > 0:\n"
                                        "    n -= 1\n"_kj);
  KJ_EXPECT(conditional.success);
  KJ_EXPECT(conditional.warnings.size() == 1);
}

KJ_TEST("ASTValidator: Imports and syntax errors") {
  ASTValidator validator;
  KJ_EXPECT(!validator.validate("import os\n"_kj).success);
  auto broken = validator.validate("x = (\n"_kj);
  KJ_EXPECT(!broken.success);
  KJ_EXPECT(broken.first_error().startsWith("Syntax error"));
}

KJ_TEST("ASTValidator: Fast path") {
  ASTValidator validator;
  KJ_EXPECT(validator.validate_fast("x = close.rolling(5).mean()\n"_kj));
  KJ_EXPECT(!validator.validate_fast("x = open('f')\n"_kj));
  KJ_EXPECT(!validator.validate_fast("x = \n"_kj));
}

} // namespace
