/**
 * @file interpreter.h
 * @brief Tree-walking evaluator for strategy snippets
 *
 * The interpreter is the only way snippet code runs. It sees market data
 * exclusively through a DataProvider, parameters through a ParamMap, and has
 * no access to files, modules or host functions beyond a fixed built-in set.
 */

#pragma once

#include "evoguard/core/error.h"
#include "evoguard/snippet/ast.h"
#include "evoguard/snippet/data_provider.h"
#include "evoguard/snippet/value.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::snippet {

using ParamMap = kj::TreeMap<kj::String, double>;

struct ExecutionLimits {
  uint64_t max_steps = 1'000'000;
  int max_call_depth = 64;
  size_t max_list_length = 1'000'000;
};

/**
 * @brief Runtime failure inside a snippet (type error, unknown name, budget
 * exhausted)
 */
class ExecutionError : public core::EvoGuardException {
public:
  explicit ExecutionError(kj::StringPtr message, int snippet_line = 0,
                          const std::source_location& location = std::source_location::current())
      : core::EvoGuardException(
            snippet_line > 0 ? kj::str(message, " (line ", snippet_line, ")") : kj::str(message),
            kj::Exception::Type::FAILED, location),
        snippet_line_(snippet_line) {}

  [[nodiscard]] int snippet_line() const noexcept {
    return snippet_line_;
  }

private:
  int snippet_line_;
};

class Interpreter {
public:
  Interpreter(const Module& module, const DataProvider& data, const ParamMap& params,
              ExecutionLimits limits = {});

  KJ_DISALLOW_COPY_AND_MOVE(Interpreter);

  /// Execute top-level statements once. @throws ExecutionError
  void run();

  /// Call a function defined by the module. @throws ExecutionError
  Value call(kj::StringPtr function_name, kj::ArrayPtr<const Value> args);

  [[nodiscard]] kj::Maybe<const Value&> global(kj::StringPtr name) const;
  [[nodiscard]] kj::Array<kj::StringPtr> global_names() const;
  [[nodiscard]] uint64_t steps_used() const noexcept {
    return steps_;
  }

private:
  enum class Flow : uint8_t { Normal, Return, Break, Continue };
  using Scope = kj::TreeMap<kj::String, Value>;

  Flow exec_block(const kj::Vector<StmtPtr>& body, Scope& scope, Value& ret);
  Flow exec(const Stmt& stmt, Scope& scope, Value& ret);
  void assign(const Expr& target, Value value, Scope& scope);

  Value eval(const Expr& expr, Scope& scope);
  Value lookup(const Expr& name, Scope& scope);
  Value attribute(const Value& object, const Expr& expr);
  Value subscript(const Value& object, const Value& index, int line);
  Value call_value(const Value& callee, kj::Vector<Value> args, Scope kwargs, int line);
  Value call_function(const Stmt& def, kj::ArrayPtr<const Value> args, Scope kwargs, int line);
  Value call_builtin(kj::StringPtr name, kj::ArrayPtr<const Value> args, int line);
  Value call_method(const Value& method, kj::ArrayPtr<const Value> args, const Scope& kwargs,
                    int line);

  Value unary(UnaryOp op, const Value& operand, int line);
  Value binary(BinaryOp op, const Value& lhs, const Value& rhs, int line);
  Value compare(CompareOp op, const Value& lhs, const Value& rhs, int line);
  bool truthy(const Value& value, int line);

  void step(int line);
  [[noreturn]] void fail(kj::StringPtr message, int line);

  const Module& module_;
  const DataProvider& data_;
  const ParamMap& params_;
  ExecutionLimits limits_;
  Scope globals_;
  uint64_t steps_ = 0;
  int depth_ = 0;
};

} // namespace evoguard::snippet
