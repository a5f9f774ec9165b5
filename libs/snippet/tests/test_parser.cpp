#include "evoguard/snippet/lexer.h"
#include "evoguard/snippet/parser.h"
#include "evoguard/snippet/printer.h"
#include "kj/test.h"

#include <kj/debug.h>
#include <kj/vector.h>

using namespace evoguard::snippet;

namespace {

kj::String reprint(kj::StringPtr source) {
  return print(parse_or_throw(source));
}

void expect_canonical(kj::StringPtr source) {
  auto printed = reprint(source);
  KJ_EXPECT(printed == source, printed, source);
}

KJ_TEST("Parser: Canonical exit block round trips") {
  expect_canonical("stop_loss_pct = 0.1\n"
                   "take_profit_pct = 0.2\n"
                   "trailing_stop_offset = 0.02\n"
                   "holding_period_days = 20\n"_kj);
}

KJ_TEST("Parser: Canonical factor function round trips") {
  expect_canonical("def factor_momentum(data, params):\n"
                   "    close = data.get('close')\n"
                   "    lookback = params.get('lookback', 20)\n"
                   "    momentum = close.pct_change(lookback)\n"
                   "    return momentum > 0.0\n"_kj);
}

KJ_TEST("Parser: Control flow round trips") {
  expect_canonical("def f(x, y=2):\n"
                   "    total = 0\n"
                   "    for i in range(x):\n"
                   "        if i % 2 == 0:\n"
                   "            total += i\n"
                   "        elif i > 5:\n"
                   "            break\n"
                   "        else:\n"
                   "            continue\n"
                   "    while total > 100:\n"
                   "        total -= y\n"
                   "    return total if total > 0 else None\n"_kj);
}

KJ_TEST("Parser: Operator precedence survives printing") {
  expect_canonical("a = (1 + 2) * 3\n"_kj);
  expect_canonical("b = 1 + 2 * 3\n"_kj);
  expect_canonical("c = -x ** 2\n"_kj);
  expect_canonical("d = not a and b or c\n"_kj);
  expect_canonical("e = (fast > slow) & (vol < 0.5)\n"_kj);
  expect_canonical("f = 0 < x <= 10\n"_kj);
}

KJ_TEST("Parser: Non-canonical input normalizes and is stable") {
  auto once = reprint("x=1+2 # comment\n"
                      "if x:\n"
                      "  y = [1,\n"
                      "       2]\n"
                      "s = \"text\"\n"_kj);
  KJ_EXPECT(once == "x = 1 + 2\n"
                    "if x:\n"
                    "    y = [1, 2]\n"
                    "s = 'text'\n",
            once);
  KJ_EXPECT(reprint(once) == once);
}

KJ_TEST("Parser: Imports are parsed") {
  expect_canonical("import os\n"_kj);
  expect_canonical("from subprocess import run as r, call\n"_kj);
}

KJ_TEST("Parser: Number spelling is preserved") {
  expect_canonical("x = 1e-06\n"_kj);
  expect_canonical("y = 0.15\n"_kj);
  KJ_EXPECT(format_number(3.0, true) == "3");
  KJ_EXPECT(format_number(0.15, false) == "0.15");
  KJ_EXPECT(format_number(2.0, false) == "2.0");
}

KJ_TEST("Parser: Syntax errors report a position") {
  KJ_IF_SOME(error, check_syntax("def f(:\n    pass\n"_kj)) {
    KJ_EXPECT(error.line == 1);
    KJ_EXPECT(error.message.size() > 0);
  }
  else {
    KJ_FAIL_EXPECT("missing parameter list should fail");
  }

  KJ_IF_SOME(error, check_syntax("x = 1\n  y = 2\n"_kj)) {
    KJ_EXPECT(error.line == 2);
  }
  else {
    KJ_FAIL_EXPECT("unexpected indent should fail");
  }

  KJ_EXPECT(check_syntax("x = (1 + 2\n"_kj) != kj::none);
  KJ_EXPECT(check_syntax("x = 'unterminated\n"_kj) != kj::none);
  KJ_EXPECT(check_syntax("x = 1\n"_kj) == kj::none);
}

KJ_TEST("Parser: Nesting depth is bounded") {
  kj::Vector<char> blocks;
  for (int level = 0; level < 150; ++level) {
    for (int i = 0; i < level * 4; ++i) {
      blocks.add(' ');
    }
    blocks.addAll("if x:\n"_kj);
  }
  for (int i = 0; i < 150 * 4; ++i) {
    blocks.add(' ');
  }
  blocks.addAll("pass\n"_kj);
  auto source = kj::heapString(blocks.begin(), blocks.size());

  KJ_IF_SOME(error, check_syntax(source)) {
    KJ_EXPECT(error.message.contains("too deeply nested"_kj), error.message);
  }
  else {
    KJ_FAIL_EXPECT("150 nested blocks should fail");
  }

  // Depth is released when a construct closes, so long flat programs parse
  kj::Vector<char> flat;
  for (int i = 0; i < 500; ++i) {
    flat.addAll("x = ((1 + 2) * -3) ** 2\n"_kj);
  }
  KJ_EXPECT(check_syntax(kj::heapString(flat.begin(), flat.size())) == kj::none);
  KJ_EXPECT(check_syntax("if a:\n    if b:\n        x = f(g(h(1)))[0].y\n"_kj) == kj::none);
}

KJ_TEST("Parser: parse returns a syntax error variant") {
  auto result = parse("if x\n    pass\n"_kj);
  KJ_EXPECT(result.is<SyntaxError>());
  KJ_EXPECT(parse("pass\n"_kj).is<Module>());
}

KJ_TEST("Parser: parse_or_throw raises SyntaxErrorException") {
  bool caught = false;
  try {
    auto module = parse_or_throw("return = 3\n"_kj);
    (void)module;
  } catch (const SyntaxErrorException& e) {
    caught = true;
    KJ_EXPECT(e.error_line() == 1);
  }
  KJ_EXPECT(caught);
}

KJ_TEST("Lexer: Indentation produces indent and dedent tokens") {
  auto tokens = tokenize("if x:\n    y = 1\nz = 2\n"_kj);
  int indents = 0;
  int dedents = 0;
  for (auto& token : tokens) {
    if (token.kind == Token::Kind::Indent) {
      ++indents;
    } else if (token.kind == Token::Kind::Dedent) {
      ++dedents;
    }
  }
  KJ_EXPECT(indents == 1);
  KJ_EXPECT(dedents == 1);
  KJ_EXPECT(tokens.back().kind == Token::Kind::EndOfFile);
}

} // namespace
