#include "evoguard/snippet/interpreter.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <kj/debug.h>
#include <limits>

namespace evoguard::snippet {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

bool is_integral(double v) {
  return std::isfinite(v) && std::floor(v) == v;
}

bool element_truthy(double v) {
  return v != 0.0 && !std::isnan(v);
}

void set_var(kj::TreeMap<kj::String, Value>& scope, kj::StringPtr name, Value value) {
  scope.upsert(kj::str(name), kj::mv(value),
               [](Value& existing, Value&& replacement) { existing = kj::mv(replacement); });
}

bool is_builtin_name(kj::StringPtr name) {
  static constexpr kj::StringPtr kBuiltins[] = {"abs"_kj, "min"_kj,   "max"_kj,  "len"_kj,
                                                "range"_kj, "float"_kj, "int"_kj, "bool"_kj,
                                                "round"_kj, "sum"_kj};
  for (auto b : kBuiltins) {
    if (b == name) {
      return true;
    }
  }
  return false;
}

bool is_series_method(kj::StringPtr name) {
  static constexpr kj::StringPtr kMethods[] = {
      "shift"_kj, "rolling"_kj, "pct_change"_kj, "diff"_kj, "abs"_kj,    "fillna"_kj,
      "mean"_kj,  "std"_kj,     "max"_kj,        "min"_kj,  "sum"_kj,    "last"_kj,
      "cumsum"_kj};
  for (auto m : kMethods) {
    if (m == name) {
      return true;
    }
  }
  return false;
}

bool is_rolling_method(kj::StringPtr name) {
  return name == "mean"_kj || name == "std"_kj || name == "max"_kj || name == "min"_kj ||
         name == "sum"_kj;
}

// NaN-skipping reductions
double reduce(kj::ArrayPtr<const double> values, kj::StringPtr op) {
  double acc = 0.0;
  double acc_sq = 0.0;
  size_t n = 0;
  double best = kNaN;
  for (double v : values) {
    if (std::isnan(v)) {
      continue;
    }
    ++n;
    acc += v;
    acc_sq += v * v;
    if (op == "max"_kj) {
      best = std::isnan(best) ? v : std::max(best, v);
    } else if (op == "min"_kj) {
      best = std::isnan(best) ? v : std::min(best, v);
    }
  }
  if (op == "sum"_kj) {
    return acc;
  }
  if (n == 0) {
    return kNaN;
  }
  if (op == "mean"_kj) {
    return acc / static_cast<double>(n);
  }
  if (op == "std"_kj) {
    if (n < 2) {
      return kNaN;
    }
    double mean = acc / static_cast<double>(n);
    double var = (acc_sq - static_cast<double>(n) * mean * mean) / static_cast<double>(n - 1);
    return std::sqrt(std::max(var, 0.0));
  }
  return best;
}

// Window must be full and NaN-free, matching min_periods == window
kj::Array<double> rolling_apply(kj::ArrayPtr<const double> src, int window, kj::StringPtr op) {
  auto out = kj::heapArray<double>(src.size());
  size_t w = static_cast<size_t>(window);
  for (size_t i = 0; i < src.size(); ++i) {
    if (i + 1 < w) {
      out[i] = kNaN;
      continue;
    }
    auto slice = src.slice(i + 1 - w, i + 1);
    bool has_nan = false;
    for (double v : slice) {
      if (std::isnan(v)) {
        has_nan = true;
        break;
      }
    }
    out[i] = has_nan ? kNaN : reduce(slice, op);
  }
  return out;
}

template <typename Fn> kj::Array<double> map_series(kj::ArrayPtr<const double> src, Fn&& fn) {
  auto out = kj::heapArray<double>(src.size());
  for (size_t i = 0; i < src.size(); ++i) {
    out[i] = fn(src[i]);
  }
  return out;
}

double apply_arith(BinaryOp op, double a, double b) {
  switch (op) {
  case BinaryOp::Add:
    return a + b;
  case BinaryOp::Sub:
    return a - b;
  case BinaryOp::Mul:
    return a * b;
  case BinaryOp::Div:
    return a / b;
  case BinaryOp::FloorDiv:
    return std::floor(a / b);
  case BinaryOp::Mod:
    return b == 0.0 ? kNaN : a - b * std::floor(a / b);
  case BinaryOp::Pow:
    return std::pow(a, b);
  case BinaryOp::BitAnd:
    return (element_truthy(a) && element_truthy(b)) ? 1.0 : 0.0;
  case BinaryOp::BitOr:
    return (element_truthy(a) || element_truthy(b)) ? 1.0 : 0.0;
  }
  KJ_UNREACHABLE;
}

bool apply_compare(CompareOp op, double a, double b) {
  switch (op) {
  case CompareOp::Lt:
    return a < b;
  case CompareOp::LtE:
    return a <= b;
  case CompareOp::Gt:
    return a > b;
  case CompareOp::GtE:
    return a >= b;
  case CompareOp::Eq:
    return a == b;
  case CompareOp::NotEq:
    return a != b;
  }
  KJ_UNREACHABLE;
}

} // namespace

Interpreter::Interpreter(const Module& module, const DataProvider& data, const ParamMap& params,
                         ExecutionLimits limits)
    : module_(module), data_(data), params_(params), limits_(limits) {
  set_var(globals_, "data"_kj, Value::data());
  set_var(globals_, "params"_kj, Value::params());
}

void Interpreter::run() {
  Value ret;
  switch (exec_block(module_.body, globals_, ret)) {
  case Flow::Normal:
    return;
  case Flow::Return:
    fail("'return' outside function"_kj, 0);
  case Flow::Break:
  case Flow::Continue:
    fail("loop control statement outside loop"_kj, 0);
  }
}

Value Interpreter::call(kj::StringPtr function_name, kj::ArrayPtr<const Value> args) {
  KJ_IF_SOME(fn, globals_.find(function_name)) {
    if (!fn.is(Value::Kind::Function)) {
      fail(kj::str("'", function_name, "' is not a function"), 0);
    }
    Value callee = fn;
    return call_function(callee.as_function(), args, Scope(), 0);
  }
  fail(kj::str("function '", function_name, "' is not defined"), 0);
}

kj::Maybe<const Value&> Interpreter::global(kj::StringPtr name) const {
  return globals_.find(name);
}

kj::Array<kj::StringPtr> Interpreter::global_names() const {
  auto builder = kj::heapArrayBuilder<kj::StringPtr>(globals_.size());
  for (auto& entry : globals_) {
    builder.add(entry.key);
  }
  return builder.finish();
}

void Interpreter::step(int line) {
  if (++steps_ > limits_.max_steps) {
    fail(kj::str("step budget exceeded (", limits_.max_steps, " steps)"), line);
  }
}

void Interpreter::fail(kj::StringPtr message, int line) {
  throw ExecutionError(message, line);
}

// ---------------------------------------------------------------------------
// Statements

Interpreter::Flow Interpreter::exec_block(const kj::Vector<StmtPtr>& body, Scope& scope,
                                          Value& ret) {
  for (auto& stmt : body) {
    Flow flow = exec(*stmt, scope, ret);
    if (flow != Flow::Normal) {
      return flow;
    }
  }
  return Flow::Normal;
}

Interpreter::Flow Interpreter::exec(const Stmt& stmt, Scope& scope, Value& ret) {
  step(stmt.line);

  switch (stmt.kind) {
  case Stmt::Kind::ExprStmt: {
    KJ_IF_SOME(value, stmt.value) {
      (void)eval(*value, scope);
    }
    return Flow::Normal;
  }

  case Stmt::Kind::Assign: {
    auto& target = KJ_ASSERT_NONNULL(stmt.target);
    auto& value = KJ_ASSERT_NONNULL(stmt.value);
    assign(*target, eval(*value, scope), scope);
    return Flow::Normal;
  }

  case Stmt::Kind::AugAssign: {
    auto& target = KJ_ASSERT_NONNULL(stmt.target);
    auto& value = KJ_ASSERT_NONNULL(stmt.value);
    Value current = eval(*target, scope);
    Value rhs = eval(*value, scope);
    assign(*target, binary(stmt.aug_op, current, rhs, stmt.line), scope);
    return Flow::Normal;
  }

  case Stmt::Kind::Import:
  case Stmt::Kind::ImportFrom:
    fail("import is not allowed"_kj, stmt.line);

  case Stmt::Kind::FunctionDef:
    set_var(scope, stmt.name, Value::function(stmt));
    return Flow::Normal;

  case Stmt::Kind::Return: {
    KJ_IF_SOME(value, stmt.value) {
      ret = eval(*value, scope);
    } else {
      ret = Value();
    }
    return Flow::Return;
  }

  case Stmt::Kind::If: {
    auto& test = KJ_ASSERT_NONNULL(stmt.test);
    if (truthy(eval(*test, scope), stmt.line)) {
      return exec_block(stmt.body, scope, ret);
    }
    return exec_block(stmt.orelse, scope, ret);
  }

  case Stmt::Kind::While: {
    auto& test = KJ_ASSERT_NONNULL(stmt.test);
    while (truthy(eval(*test, scope), stmt.line)) {
      step(stmt.line);
      Flow flow = exec_block(stmt.body, scope, ret);
      if (flow == Flow::Break) {
        break;
      }
      if (flow == Flow::Return) {
        return flow;
      }
    }
    return Flow::Normal;
  }

  case Stmt::Kind::For: {
    auto& target = KJ_ASSERT_NONNULL(stmt.target);
    auto& iter_expr = KJ_ASSERT_NONNULL(stmt.iter);
    Value iterable = eval(*iter_expr, scope);

    kj::Vector<Value> items;
    switch (iterable.kind()) {
    case Value::Kind::List:
      for (auto& item : iterable.as_list()) {
        items.add(item);
      }
      break;
    case Value::Kind::Series:
      for (double v : iterable.as_series()) {
        items.add(Value::number(v));
      }
      break;
    case Value::Kind::String:
      for (char c : iterable.as_string()) {
        items.add(Value::string(kj::heapString(&c, 1)));
      }
      break;
    default:
      fail(kj::str("'", iterable.type_name(), "' object is not iterable"), stmt.line);
    }

    for (auto& item : items) {
      step(stmt.line);
      assign(*target, kj::mv(item), scope);
      Flow flow = exec_block(stmt.body, scope, ret);
      if (flow == Flow::Break) {
        break;
      }
      if (flow == Flow::Return) {
        return flow;
      }
    }
    return Flow::Normal;
  }

  case Stmt::Kind::Pass:
    return Flow::Normal;
  case Stmt::Kind::Break:
    return Flow::Break;
  case Stmt::Kind::Continue:
    return Flow::Continue;
  }
  KJ_UNREACHABLE;
}

void Interpreter::assign(const Expr& target, Value value, Scope& scope) {
  switch (target.kind) {
  case Expr::Kind::Name:
    set_var(scope, target.text, kj::mv(value));
    return;

  case Expr::Kind::Tuple:
  case Expr::Kind::List: {
    if (!value.is(Value::Kind::List)) {
      fail(kj::str("cannot unpack non-sequence ", value.type_name()), target.line);
    }
    auto items = value.as_list();
    if (items.size() != target.children.size()) {
      fail(kj::str("expected ", target.children.size(), " values to unpack, got ", items.size()),
           target.line);
    }
    for (size_t i = 0; i < items.size(); ++i) {
      assign(*target.children[i], items[i], scope);
    }
    return;
  }

  case Expr::Kind::Subscript: {
    Value object = eval(*target.children[0], scope);
    Value index = eval(*target.children[1], scope);
    if (!object.is(Value::Kind::List)) {
      fail(kj::str("'", object.type_name(), "' object does not support item assignment"),
           target.line);
    }
    if (!index.is_numeric() || !is_integral(index.as_number())) {
      fail("list indices must be integers"_kj, target.line);
    }
    auto& data = object.list_data();
    int64_t i = static_cast<int64_t>(index.as_number());
    int64_t n = static_cast<int64_t>(data.items.size());
    if (i < 0) {
      i += n;
    }
    if (i < 0 || i >= n) {
      fail("list assignment index out of range"_kj, target.line);
    }
    data.items[static_cast<size_t>(i)] = kj::mv(value);
    return;
  }

  case Expr::Kind::Attribute:
    fail("attribute assignment is not supported"_kj, target.line);

  default:
    fail("cannot assign to expression"_kj, target.line);
  }
}

// ---------------------------------------------------------------------------
// Expressions

Value Interpreter::eval(const Expr& expr, Scope& scope) {
  switch (expr.kind) {
  case Expr::Kind::Number:
    return Value::number(expr.number);
  case Expr::Kind::String:
    return Value::string(expr.text);
  case Expr::Kind::Bool:
    return Value::boolean(expr.bool_value);
  case Expr::Kind::NoneLiteral:
    return Value();
  case Expr::Kind::Name:
    return lookup(expr, scope);

  case Expr::Kind::Attribute:
    return attribute(eval(*expr.children[0], scope), expr);

  case Expr::Kind::Subscript: {
    Value object = eval(*expr.children[0], scope);
    Value index = eval(*expr.children[1], scope);
    return subscript(object, index, expr.line);
  }

  case Expr::Kind::Call: {
    step(expr.line);
    Value callee = eval(*expr.children[0], scope);
    kj::Vector<Value> args;
    for (size_t i = 1; i < expr.children.size(); ++i) {
      args.add(eval(*expr.children[i], scope));
    }
    Scope kwargs;
    for (auto& kw : expr.keywords) {
      set_var(kwargs, kw.name, eval(*kw.value, scope));
    }
    return call_value(callee, kj::mv(args), kj::mv(kwargs), expr.line);
  }

  case Expr::Kind::Unary:
    return unary(expr.unary_op, eval(*expr.children[0], scope), expr.line);

  case Expr::Kind::Binary: {
    Value lhs = eval(*expr.children[0], scope);
    Value rhs = eval(*expr.children[1], scope);
    return binary(expr.binary_op, lhs, rhs, expr.line);
  }

  case Expr::Kind::Compare: {
    Value left = eval(*expr.children[0], scope);
    Value result;
    for (size_t i = 0; i < expr.compare_ops.size(); ++i) {
      Value right = eval(*expr.children[i + 1], scope);
      Value part = compare(expr.compare_ops[i], left, right, expr.line);
      if (i == 0) {
        result = kj::mv(part);
      } else {
        result = binary(BinaryOp::BitAnd, result, part, expr.line);
      }
      if (result.is(Value::Kind::Bool) && !result.as_bool()) {
        return result;
      }
      left = kj::mv(right);
    }
    return result;
  }

  case Expr::Kind::BoolOp: {
    Value value = eval(*expr.children[0], scope);
    for (size_t i = 1; i < expr.children.size(); ++i) {
      bool t = truthy(value, expr.line);
      if (expr.bool_op == BoolOpKind::And ? !t : t) {
        return value;
      }
      value = eval(*expr.children[i], scope);
    }
    return value;
  }

  case Expr::Kind::IfExp:
    if (truthy(eval(*expr.children[1], scope), expr.line)) {
      return eval(*expr.children[0], scope);
    }
    return eval(*expr.children[2], scope);

  case Expr::Kind::List:
  case Expr::Kind::Tuple: {
    kj::Vector<Value> items;
    for (auto& child : expr.children) {
      items.add(eval(*child, scope));
    }
    return Value::list(kj::mv(items));
  }
  }
  KJ_UNREACHABLE;
}

Value Interpreter::lookup(const Expr& name, Scope& scope) {
  KJ_IF_SOME(value, scope.find(name.text)) {
    return value;
  }
  if (&scope != &globals_) {
    KJ_IF_SOME(value, globals_.find(name.text)) {
      return value;
    }
  }
  if (is_builtin_name(name.text)) {
    return Value::builtin(name.text);
  }
  fail(kj::str("name '", name.text, "' is not defined"), name.line);
}

Value Interpreter::attribute(const Value& object, const Expr& expr) {
  kj::StringPtr attr = expr.text;
  switch (object.kind()) {
  case Value::Kind::Data:
    if (attr == "get"_kj) {
      return object.bind_method(attr);
    }
    KJ_IF_SOME(column, data_.column(attr)) {
      return Value::series(kj::heapArray(column));
    }
    fail(kj::str("data has no column '", attr, "'"), expr.line);

  case Value::Kind::Params:
    if (attr == "get"_kj) {
      return object.bind_method(attr);
    }
    KJ_IF_SOME(value, params_.find(attr)) {
      return Value::number(value);
    }
    fail(kj::str("params has no entry '", attr, "'"), expr.line);

  case Value::Kind::Series:
    if (is_series_method(attr)) {
      return object.bind_method(attr);
    }
    break;

  case Value::Kind::Rolling:
    if (is_rolling_method(attr)) {
      return object.bind_method(attr);
    }
    break;

  case Value::Kind::List:
    if (attr == "append"_kj) {
      return object.bind_method(attr);
    }
    break;

  default:
    break;
  }
  fail(kj::str("'", object.type_name(), "' object has no attribute '", attr, "'"), expr.line);
}

Value Interpreter::subscript(const Value& object, const Value& index, int line) {
  auto normalize = [&](size_t size) -> size_t {
    if (!index.is_numeric() || !is_integral(index.as_number())) {
      fail(kj::str("indices must be integers, not ", index.type_name()), line);
    }
    int64_t i = static_cast<int64_t>(index.as_number());
    int64_t n = static_cast<int64_t>(size);
    if (i < 0) {
      i += n;
    }
    if (i < 0 || i >= n) {
      fail("index out of range"_kj, line);
    }
    return static_cast<size_t>(i);
  };

  switch (object.kind()) {
  case Value::Kind::Data: {
    if (!index.is(Value::Kind::String)) {
      fail("data columns are addressed by name"_kj, line);
    }
    KJ_IF_SOME(column, data_.column(index.as_string())) {
      return Value::series(kj::heapArray(column));
    }
    fail(kj::str("KeyError: '", index.as_string(), "'"), line);
  }
  case Value::Kind::Params: {
    if (!index.is(Value::Kind::String)) {
      fail("params are addressed by name"_kj, line);
    }
    KJ_IF_SOME(value, params_.find(index.as_string())) {
      return Value::number(value);
    }
    fail(kj::str("KeyError: '", index.as_string(), "'"), line);
  }
  case Value::Kind::List: {
    auto items = object.as_list();
    return items[normalize(items.size())];
  }
  case Value::Kind::Series: {
    auto values = object.as_series();
    return Value::number(values[normalize(values.size())]);
  }
  case Value::Kind::String: {
    auto text = object.as_string();
    size_t i = normalize(text.size());
    return Value::string(kj::heapString(text.begin() + i, 1));
  }
  default:
    fail(kj::str("'", object.type_name(), "' object is not subscriptable"), line);
  }
}

// ---------------------------------------------------------------------------
// Calls

Value Interpreter::call_value(const Value& callee, kj::Vector<Value> args, Scope kwargs,
                              int line) {
  switch (callee.kind()) {
  case Value::Kind::Function:
    return call_function(callee.as_function(), args.asPtr(), kj::mv(kwargs), line);
  case Value::Kind::Builtin:
    if (kwargs.size() != 0) {
      fail(kj::str(callee.name(), "() takes no keyword arguments"), line);
    }
    return call_builtin(callee.name(), args.asPtr(), line);
  case Value::Kind::Method:
    return call_method(callee, args.asPtr(), kwargs, line);
  default:
    fail(kj::str("'", callee.type_name(), "' object is not callable"), line);
  }
}

Value Interpreter::call_function(const Stmt& def, kj::ArrayPtr<const Value> args, Scope kwargs,
                                 int line) {
  if (depth_ >= limits_.max_call_depth) {
    fail("maximum recursion depth exceeded"_kj, line);
  }
  if (args.size() > def.params.size()) {
    fail(kj::str(def.name, "() takes ", def.params.size(), " positional arguments but ",
                 args.size(), " were given"),
         line);
  }

  Scope locals;
  for (size_t i = 0; i < def.params.size(); ++i) {
    auto& param = def.params[i];
    if (i < args.size()) {
      set_var(locals, param.name, args[i]);
      continue;
    }
    KJ_IF_SOME(value, kwargs.find(param.name)) {
      set_var(locals, param.name, kj::mv(value));
      continue;
    }
    KJ_IF_SOME(default_value, param.default_value) {
      set_var(locals, param.name, eval(*default_value, globals_));
      continue;
    }
    fail(kj::str(def.name, "() missing required argument '", param.name, "'"), line);
  }
  for (auto& kw : kwargs) {
    bool known = false;
    for (auto& param : def.params) {
      if (param.name == kw.key) {
        known = true;
        break;
      }
    }
    if (!known) {
      fail(kj::str(def.name, "() got an unexpected keyword argument '", kw.key, "'"), line);
    }
  }

  ++depth_;
  KJ_DEFER(--depth_);
  Value ret;
  switch (exec_block(def.body, locals, ret)) {
  case Flow::Normal:
  case Flow::Return:
    return ret;
  case Flow::Break:
  case Flow::Continue:
    fail("loop control statement outside loop"_kj, def.line);
  }
  KJ_UNREACHABLE;
}

Value Interpreter::call_builtin(kj::StringPtr name, kj::ArrayPtr<const Value> args, int line) {
  auto arity = [&](size_t min, size_t max) {
    if (args.size() < min || args.size() > max) {
      fail(kj::str(name, "() got ", args.size(), " arguments"), line);
    }
  };
  auto number_arg = [&](size_t i) -> double {
    if (!args[i].is_numeric()) {
      fail(kj::str(name, "() argument must be a number, not ", args[i].type_name()), line);
    }
    return args[i].as_number();
  };

  if (name == "abs"_kj) {
    arity(1, 1);
    if (args[0].is(Value::Kind::Series)) {
      return Value::series(map_series(args[0].as_series(), [](double v) { return std::fabs(v); }));
    }
    return Value::number(std::fabs(number_arg(0)));
  }

  if (name == "min"_kj || name == "max"_kj) {
    arity(1, std::numeric_limits<size_t>::max());
    bool is_min = name == "min"_kj;
    kj::Vector<double> candidates;
    if (args.size() == 1) {
      if (args[0].is(Value::Kind::Series)) {
        return Value::number(reduce(args[0].as_series(), name));
      }
      if (!args[0].is(Value::Kind::List)) {
        fail(kj::str("'", args[0].type_name(), "' object is not iterable"), line);
      }
      for (auto& item : args[0].as_list()) {
        if (!item.is_numeric()) {
          fail(kj::str(name, "() requires numbers"), line);
        }
        candidates.add(item.as_number());
      }
    } else {
      for (size_t i = 0; i < args.size(); ++i) {
        candidates.add(number_arg(i));
      }
    }
    if (candidates.empty()) {
      fail(kj::str(name, "() arg is an empty sequence"), line);
    }
    double best = candidates[0];
    for (double c : candidates) {
      best = is_min ? std::min(best, c) : std::max(best, c);
    }
    return Value::number(best);
  }

  if (name == "len"_kj) {
    arity(1, 1);
    switch (args[0].kind()) {
    case Value::Kind::List:
      return Value::number(static_cast<double>(args[0].as_list().size()));
    case Value::Kind::Series:
      return Value::number(static_cast<double>(args[0].as_series().size()));
    case Value::Kind::String:
      return Value::number(static_cast<double>(args[0].as_string().size()));
    case Value::Kind::Data:
      return Value::number(static_cast<double>(data_.length()));
    default:
      fail(kj::str("object of type '", args[0].type_name(), "' has no len()"), line);
    }
  }

  if (name == "range"_kj) {
    arity(1, 3);
    for (size_t i = 0; i < args.size(); ++i) {
      if (!is_integral(number_arg(i))) {
        fail("range() arguments must be integers"_kj, line);
      }
    }
    int64_t start = 0;
    int64_t stop = 0;
    int64_t stride = 1;
    if (args.size() == 1) {
      stop = static_cast<int64_t>(args[0].as_number());
    } else {
      start = static_cast<int64_t>(args[0].as_number());
      stop = static_cast<int64_t>(args[1].as_number());
      if (args.size() == 3) {
        stride = static_cast<int64_t>(args[2].as_number());
      }
    }
    if (stride == 0) {
      fail("range() arg 3 must not be zero"_kj, line);
    }
    kj::Vector<Value> items;
    for (int64_t i = start; stride > 0 ? i < stop : i > stop; i += stride) {
      if (items.size() >= limits_.max_list_length) {
        fail("range() too large"_kj, line);
      }
      items.add(Value::number(static_cast<double>(i)));
    }
    return Value::list(kj::mv(items));
  }

  if (name == "float"_kj) {
    arity(0, 1);
    if (args.size() == 0) {
      return Value::number(0.0);
    }
    if (args[0].is(Value::Kind::String)) {
      kj::StringPtr text = args[0].as_string();
      char* end = nullptr;
      double v = std::strtod(text.cStr(), &end);
      if (text.size() == 0 || end != text.cStr() + text.size()) {
        fail(kj::str("could not convert string to float: '", text, "'"), line);
      }
      return Value::number(v);
    }
    return Value::number(number_arg(0));
  }

  if (name == "int"_kj) {
    arity(0, 1);
    if (args.size() == 0) {
      return Value::number(0.0);
    }
    double v = number_arg(0);
    if (!std::isfinite(v)) {
      fail("cannot convert non-finite value to integer"_kj, line);
    }
    return Value::number(std::trunc(v));
  }

  if (name == "bool"_kj) {
    arity(0, 1);
    return Value::boolean(args.size() == 1 && truthy(args[0], line));
  }

  if (name == "round"_kj) {
    arity(1, 2);
    double v = number_arg(0);
    double digits = args.size() == 2 ? number_arg(1) : 0.0;
    double scale = std::pow(10.0, digits);
    return Value::number(std::nearbyint(v * scale) / scale);
  }

  if (name == "sum"_kj) {
    arity(1, 1);
    if (args[0].is(Value::Kind::Series)) {
      return Value::number(reduce(args[0].as_series(), "sum"_kj));
    }
    if (!args[0].is(Value::Kind::List)) {
      fail(kj::str("'", args[0].type_name(), "' object is not iterable"), line);
    }
    double total = 0.0;
    for (auto& item : args[0].as_list()) {
      if (!item.is_numeric()) {
        fail("sum() requires numbers"_kj, line);
      }
      total += item.as_number();
    }
    return Value::number(total);
  }

  fail(kj::str("name '", name, "' is not defined"), line);
}

Value Interpreter::call_method(const Value& method, kj::ArrayPtr<const Value> args,
                               const Scope& kwargs, int line) {
  kj::StringPtr name = method.name();
  Value self = method.receiver();

  auto arg = [&](size_t i, kj::StringPtr keyword) -> kj::Maybe<const Value&> {
    if (i < args.size()) {
      return args[i];
    }
    return kwargs.find(keyword);
  };
  auto int_arg = [&](size_t i, kj::StringPtr keyword, int64_t fallback) -> int64_t {
    KJ_IF_SOME(v, arg(i, keyword)) {
      if (!v.is_numeric() || !is_integral(v.as_number())) {
        fail(kj::str(name, "() argument '", keyword, "' must be an integer"), line);
      }
      return static_cast<int64_t>(v.as_number());
    }
    return fallback;
  };
  auto max_args = [&](size_t n) {
    if (args.size() + kwargs.size() > n) {
      fail(kj::str(name, "() got too many arguments"), line);
    }
  };

  switch (self.kind()) {
  case Value::Kind::Data: {
    max_args(2);
    KJ_IF_SOME(key, arg(0, "key"_kj)) {
      if (!key.is(Value::Kind::String)) {
        fail("data.get() key must be a string"_kj, line);
      }
      KJ_IF_SOME(column, data_.column(key.as_string())) {
        return Value::series(kj::heapArray(column));
      }
      KJ_IF_SOME(fallback, arg(1, "default"_kj)) {
        return fallback;
      }
      return Value();
    }
    fail("data.get() missing key"_kj, line);
  }

  case Value::Kind::Params: {
    max_args(2);
    KJ_IF_SOME(key, arg(0, "key"_kj)) {
      if (!key.is(Value::Kind::String)) {
        fail("params.get() key must be a string"_kj, line);
      }
      KJ_IF_SOME(value, params_.find(key.as_string())) {
        return Value::number(value);
      }
      KJ_IF_SOME(fallback, arg(1, "default"_kj)) {
        return fallback;
      }
      return Value();
    }
    fail("params.get() missing key"_kj, line);
  }

  case Value::Kind::List: {
    max_args(1);
    KJ_IF_SOME(item, arg(0, "object"_kj)) {
      auto& data = self.list_data();
      if (data.items.size() >= limits_.max_list_length) {
        fail("list too large"_kj, line);
      }
      data.items.add(item);
      return Value();
    }
    fail("append() takes exactly one argument"_kj, line);
  }

  case Value::Kind::Rolling: {
    max_args(0);
    return Value::series(rolling_apply(self.as_series(), self.window(), name));
  }

  case Value::Kind::Series:
    break;

  default:
    fail(kj::str("'", self.type_name(), "' object has no attribute '", name, "'"), line);
  }

  auto src = self.as_series();
  size_t n = src.size();

  if (name == "shift"_kj || name == "diff"_kj || name == "pct_change"_kj) {
    max_args(1);
    int64_t periods = int_arg(0, "periods"_kj, 1);
    auto out = kj::heapArray<double>(n);
    for (size_t i = 0; i < n; ++i) {
      int64_t j = static_cast<int64_t>(i) - periods;
      double prev = (j >= 0 && j < static_cast<int64_t>(n)) ? src[static_cast<size_t>(j)] : kNaN;
      if (name == "shift"_kj) {
        out[i] = prev;
      } else if (name == "diff"_kj) {
        out[i] = src[i] - prev;
      } else {
        out[i] = src[i] / prev - 1.0;
      }
    }
    return Value::series(kj::mv(out));
  }

  if (name == "rolling"_kj) {
    max_args(1);
    int64_t window = int_arg(0, "window"_kj, 0);
    if (window < 1 || window > 100000) {
      fail("rolling() window must be between 1 and 100000"_kj, line);
    }
    return Value::rolling(self, static_cast<int>(window));
  }

  if (name == "abs"_kj) {
    max_args(0);
    return Value::series(map_series(src, [](double v) { return std::fabs(v); }));
  }

  if (name == "fillna"_kj) {
    max_args(1);
    KJ_IF_SOME(v, arg(0, "value"_kj)) {
      if (!v.is_numeric()) {
        fail("fillna() value must be a number"_kj, line);
      }
      double fill = v.as_number();
      return Value::series(map_series(src, [fill](double x) { return std::isnan(x) ? fill : x; }));
    }
    fail("fillna() missing value"_kj, line);
  }

  if (name == "cumsum"_kj) {
    max_args(0);
    double acc = 0.0;
    return Value::series(map_series(src, [&acc](double x) {
      if (std::isnan(x)) {
        return x;
      }
      acc += x;
      return acc;
    }));
  }

  if (name == "last"_kj) {
    max_args(0);
    return Value::number(n == 0 ? kNaN : src[n - 1]);
  }

  // mean, std, max, min, sum
  max_args(0);
  return Value::number(reduce(src, name));
}

// ---------------------------------------------------------------------------
// Operators

bool Interpreter::truthy(const Value& value, int line) {
  switch (value.kind()) {
  case Value::Kind::None:
    return false;
  case Value::Kind::Bool:
  case Value::Kind::Number:
    return value.as_number() != 0.0;
  case Value::Kind::String:
    return value.as_string().size() != 0;
  case Value::Kind::List:
    return value.as_list().size() != 0;
  case Value::Kind::Series:
  case Value::Kind::Rolling:
    fail("the truth value of a Series is ambiguous; use & or | instead"_kj, line);
  default:
    return true;
  }
}

Value Interpreter::unary(UnaryOp op, const Value& operand, int line) {
  if (op == UnaryOp::Not) {
    return Value::boolean(!truthy(operand, line));
  }

  if (operand.is(Value::Kind::Series)) {
    auto src = operand.as_series();
    switch (op) {
    case UnaryOp::Neg:
      return Value::series(map_series(src, [](double v) { return -v; }));
    case UnaryOp::Pos:
      return operand;
    case UnaryOp::Invert:
      return Value::series(map_series(src, [](double v) { return element_truthy(v) ? 0.0 : 1.0; }));
    case UnaryOp::Not:
      break;
    }
    KJ_UNREACHABLE;
  }

  if (!operand.is_numeric()) {
    fail(kj::str("bad operand type for unary ", to_string(op), ": '", operand.type_name(), "'"),
         line);
  }
  double v = operand.as_number();
  switch (op) {
  case UnaryOp::Neg:
    return Value::number(-v);
  case UnaryOp::Pos:
    return Value::number(v);
  case UnaryOp::Invert:
    if (operand.is(Value::Kind::Bool)) {
      return Value::boolean(v == 0.0);
    }
    if (!is_integral(v)) {
      fail("bad operand type for unary ~: 'float'"_kj, line);
    }
    return Value::number(static_cast<double>(~static_cast<int64_t>(v)));
  case UnaryOp::Not:
    break;
  }
  KJ_UNREACHABLE;
}

Value Interpreter::binary(BinaryOp op, const Value& lhs, const Value& rhs, int line) {
  bool lhs_series = lhs.is(Value::Kind::Series);
  bool rhs_series = rhs.is(Value::Kind::Series);

  if (lhs_series || rhs_series) {
    if ((!lhs_series && !lhs.is_numeric()) || (!rhs_series && !rhs.is_numeric())) {
      fail(kj::str("unsupported operand types for ", to_string(op), ": '", lhs.type_name(),
                   "' and '", rhs.type_name(), "'"),
           line);
    }
    if (lhs_series && rhs_series) {
      auto a = lhs.as_series();
      auto b = rhs.as_series();
      if (a.size() != b.size()) {
        fail(kj::str("Series length mismatch: ", a.size(), " vs ", b.size()), line);
      }
      auto out = kj::heapArray<double>(a.size());
      for (size_t i = 0; i < a.size(); ++i) {
        out[i] = apply_arith(op, a[i], b[i]);
      }
      return Value::series(kj::mv(out));
    }
    if (lhs_series) {
      double b = rhs.as_number();
      return Value::series(map_series(lhs.as_series(), [op, b](double a) { return apply_arith(op, a, b); }));
    }
    double a = lhs.as_number();
    return Value::series(map_series(rhs.as_series(), [op, a](double b) { return apply_arith(op, a, b); }));
  }

  if (lhs.is_numeric() && rhs.is_numeric()) {
    double a = lhs.as_number();
    double b = rhs.as_number();
    switch (op) {
    case BinaryOp::Div:
    case BinaryOp::FloorDiv:
    case BinaryOp::Mod:
      if (b == 0.0) {
        fail("division by zero"_kj, line);
      }
      break;
    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
      if (lhs.is(Value::Kind::Bool) && rhs.is(Value::Kind::Bool)) {
        return Value::boolean(op == BinaryOp::BitAnd ? (a != 0.0 && b != 0.0)
                                                     : (a != 0.0 || b != 0.0));
      }
      if (!is_integral(a) || !is_integral(b)) {
        fail(kj::str("unsupported operand types for ", to_string(op), ": 'float'"), line);
      }
      {
        auto x = static_cast<int64_t>(a);
        auto y = static_cast<int64_t>(b);
        return Value::number(static_cast<double>(op == BinaryOp::BitAnd ? (x & y) : (x | y)));
      }
    default:
      break;
    }
    return Value::number(apply_arith(op, a, b));
  }

  if (op == BinaryOp::Add && lhs.is(Value::Kind::String) && rhs.is(Value::Kind::String)) {
    return Value::string(kj::str(lhs.as_string(), rhs.as_string()));
  }
  if (op == BinaryOp::Add && lhs.is(Value::Kind::List) && rhs.is(Value::Kind::List)) {
    kj::Vector<Value> items;
    for (auto& v : lhs.as_list()) {
      items.add(v);
    }
    for (auto& v : rhs.as_list()) {
      items.add(v);
    }
    return Value::list(kj::mv(items));
  }

  fail(kj::str("unsupported operand types for ", to_string(op), ": '", lhs.type_name(), "' and '",
               rhs.type_name(), "'"),
       line);
}

Value Interpreter::compare(CompareOp op, const Value& lhs, const Value& rhs, int line) {
  bool lhs_series = lhs.is(Value::Kind::Series);
  bool rhs_series = rhs.is(Value::Kind::Series);

  if (lhs_series || rhs_series) {
    if ((!lhs_series && !lhs.is_numeric()) || (!rhs_series && !rhs.is_numeric())) {
      fail(kj::str("cannot compare '", lhs.type_name(), "' with '", rhs.type_name(), "'"), line);
    }
    auto a = lhs_series ? lhs.as_series() : rhs.as_series();
    auto out = kj::heapArray<double>(a.size());
    if (lhs_series && rhs_series) {
      auto b = rhs.as_series();
      if (a.size() != b.size()) {
        fail(kj::str("Series length mismatch: ", a.size(), " vs ", b.size()), line);
      }
      for (size_t i = 0; i < a.size(); ++i) {
        out[i] = apply_compare(op, a[i], b[i]) ? 1.0 : 0.0;
      }
    } else if (lhs_series) {
      double b = rhs.as_number();
      for (size_t i = 0; i < a.size(); ++i) {
        out[i] = apply_compare(op, a[i], b) ? 1.0 : 0.0;
      }
    } else {
      double x = lhs.as_number();
      for (size_t i = 0; i < a.size(); ++i) {
        out[i] = apply_compare(op, x, a[i]) ? 1.0 : 0.0;
      }
    }
    return Value::series(kj::mv(out));
  }

  if (lhs.is_numeric() && rhs.is_numeric()) {
    return Value::boolean(apply_compare(op, lhs.as_number(), rhs.as_number()));
  }

  if (lhs.is(Value::Kind::String) && rhs.is(Value::Kind::String)) {
    kj::StringPtr a = lhs.as_string();
    kj::StringPtr b = rhs.as_string();
    switch (op) {
    case CompareOp::Lt:
      return Value::boolean(a < b);
    case CompareOp::LtE:
      return Value::boolean(!(b < a));
    case CompareOp::Gt:
      return Value::boolean(b < a);
    case CompareOp::GtE:
      return Value::boolean(!(a < b));
    case CompareOp::Eq:
      return Value::boolean(a == b);
    case CompareOp::NotEq:
      return Value::boolean(a != b);
    }
  }

  if (op == CompareOp::Eq || op == CompareOp::NotEq) {
    bool equal = lhs.is(Value::Kind::None) && rhs.is(Value::Kind::None);
    return Value::boolean(op == CompareOp::Eq ? equal : !equal);
  }

  fail(kj::str("'", to_string(op), "' not supported between '", lhs.type_name(), "' and '",
               rhs.type_name(), "'"),
       line);
}

} // namespace evoguard::snippet
