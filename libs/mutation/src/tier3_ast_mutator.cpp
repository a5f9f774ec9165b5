#include "evoguard/mutation/tier3_ast_mutator.h"

#include "evoguard/core/error.h"
#include "evoguard/snippet/parser.h"
#include "evoguard/snippet/printer.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

using snippet::BinaryOp;
using snippet::CompareOp;
using snippet::Expr;

constexpr AstTransform kTransforms[] = {
    AstTransform::OperatorMutation, AstTransform::ThresholdAdjustment,
    AstTransform::ExpressionModification, AstTransform::AdaptiveParameter};

constexpr AdaptiveKind kAdaptiveKinds[] = {AdaptiveKind::Volatility, AdaptiveKind::Regime,
                                           AdaptiveKind::Bounded};

bool is_ordering(CompareOp op) {
  return op == CompareOp::Lt || op == CompareOp::LtE || op == CompareOp::Gt ||
         op == CompareOp::GtE;
}

bool is_arithmetic(BinaryOp op) {
  return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
         op == BinaryOp::Div;
}

bool eligible(const Expr& expr, AstTransform transform) {
  switch (transform) {
  case AstTransform::OperatorMutation:
    if (expr.kind != Expr::Kind::Compare) {
      return false;
    }
    for (auto op : expr.compare_ops) {
      if (is_ordering(op)) {
        return true;
      }
    }
    return false;
  case AstTransform::ThresholdAdjustment:
    return expr.kind == Expr::Kind::Number && expr.number != 0.0;
  case AstTransform::ExpressionModification:
    return expr.kind == Expr::Kind::Binary && is_arithmetic(expr.binary_op);
  case AstTransform::AdaptiveParameter:
    return false;
  }
  KJ_UNREACHABLE;
}

CompareOp swap(CompareOp op) {
  switch (op) {
  case CompareOp::Lt:
    return CompareOp::LtE;
  case CompareOp::LtE:
    return CompareOp::Lt;
  case CompareOp::Gt:
    return CompareOp::GtE;
  case CompareOp::GtE:
    return CompareOp::Gt;
  default:
    return op;
  }
}

BinaryOp swap(BinaryOp op) {
  switch (op) {
  case BinaryOp::Add:
    return BinaryOp::Sub;
  case BinaryOp::Sub:
    return BinaryOp::Add;
  case BinaryOp::Mul:
    return BinaryOp::Div;
  case BinaryOp::Div:
    return BinaryOp::Mul;
  default:
    return op;
  }
}

// Only function bodies are rewritten; parameter defaults are overridden by
// the factor's parameter map at run time.
kj::Vector<Expr*> collect(snippet::Module& module, AstTransform transform) {
  kj::Vector<Expr*> nodes;
  for (auto& stmt : module.body) {
    if (stmt->kind != snippet::Stmt::Kind::FunctionDef) {
      continue;
    }
    for (auto& inner : stmt->body) {
      snippet::for_each_expr_mut(*inner, [&](Expr& expr) {
        if (eligible(expr, transform)) {
          nodes.add(&expr);
        }
      });
    }
  }
  return nodes;
}

snippet::Stmt* first_function(snippet::Module& module) {
  for (auto& stmt : module.body) {
    if (stmt->kind == snippet::Stmt::Kind::FunctionDef) {
      return stmt.get();
    }
  }
  return nullptr;
}

bool reads_name(const snippet::Stmt& def, kj::StringPtr name) {
  bool found = false;
  for (auto& inner : def.body) {
    snippet::for_each_expr(*inner, [&](const Expr& expr) {
      if (expr.kind == Expr::Kind::Name && expr.text == name) {
        found = true;
      }
    });
  }
  return found;
}

bool rebinds_name(const snippet::Stmt& def, kj::StringPtr name) {
  for (auto& inner : def.body) {
    if (inner->kind != snippet::Stmt::Kind::Assign) {
      continue;
    }
    KJ_IF_SOME(target, inner->target) {
      if (target->kind == Expr::Kind::Name && target->text == name) {
        return true;
      }
    }
  }
  return false;
}

// Numeric keyword default of `def`, skipping the leading data parameter
kj::Maybe<const Expr&> numeric_default(const snippet::Stmt& def, kj::StringPtr name) {
  for (size_t i = 1; i < def.params.size(); ++i) {
    if (def.params[i].name != name) {
      continue;
    }
    KJ_IF_SOME(value, def.params[i].default_value) {
      if (value->kind == Expr::Kind::Number) {
        return *value;
      }
    }
    return kj::none;
  }
  return kj::none;
}

kj::Vector<kj::StringPtr> adaptive_candidates(snippet::Module& module) {
  kj::Vector<kj::StringPtr> names;
  auto* def = first_function(module);
  if (def == nullptr) {
    return names;
  }
  for (size_t i = 1; i < def->params.size(); ++i) {
    kj::StringPtr name = def->params[i].name;
    if (numeric_default(*def, name) != kj::none && reads_name(*def, name) &&
        !rebinds_name(*def, name)) {
      names.add(name);
    }
  }
  return names;
}

kj::String num(double value) {
  return snippet::format_number(value, false);
}

// Source of the statements that rebind `param`; `data` is the data parameter
kj::String adaptive_source(kj::StringPtr data, kj::StringPtr param, bool integral,
                           AdaptiveKind kind, AdaptiveBounds bounds) {
  kj::String prelude;
  kj::String adapted;
  switch (kind) {
  case AdaptiveKind::Volatility:
    prelude = kj::str("adaptive_returns = ", data, ".get('close').pct_change(1)\n",
                      "adaptive_ratio = (adaptive_returns.rolling(20).std() / "
                      "(adaptive_returns.std() + 1e-12)).fillna(1.0).mean()\n");
    adapted = kj::str(param, " * min(max(adaptive_ratio, 0.5), 2.0)");
    break;
  case AdaptiveKind::Regime:
    prelude = kj::str("adaptive_close = ", data, ".get('close')\n",
                      "adaptive_sma = adaptive_close.rolling(50).mean()\n",
                      "adaptive_bull = (adaptive_close > adaptive_sma * 1.05).fillna(0.0).mean()\n",
                      "adaptive_bear = (adaptive_close < adaptive_sma * 0.95).fillna(0.0).mean()\n");
    adapted = kj::str(param, " * (1.0 + 0.2 * (adaptive_bear - adaptive_bull))");
    break;
  case AdaptiveKind::Bounded:
    prelude = kj::str("adaptive_vol = ", data, ".get('close').pct_change(1).rolling(20).std()\n",
                      "adaptive_level = ((adaptive_vol - adaptive_vol.min()) / "
                      "(adaptive_vol.max() - adaptive_vol.min() + 1e-12)).fillna(0.5).mean()\n");
    adapted = kj::str("min(max(", param, " * 0.9 + (", num(bounds.min), " + adaptive_level * ",
                      num(bounds.max - bounds.min), ") * 0.1, ", num(bounds.min), "), ",
                      num(bounds.max), ")");
    break;
  }
  if (integral) {
    return kj::str(prelude, param, " = max(1, int(round(", adapted, ")))\n");
  }
  return kj::str(prelude, param, " = ", adapted, "\n");
}

} // namespace

kj::StringPtr mutation_type_name(AstTransform transform) {
  switch (transform) {
  case AstTransform::OperatorMutation:
    return "ast_operator_mutation"_kj;
  case AstTransform::ThresholdAdjustment:
    return "ast_threshold_adjustment"_kj;
  case AstTransform::ExpressionModification:
    return "ast_expression_modification"_kj;
  case AstTransform::AdaptiveParameter:
    return "ast_adaptive_parameter"_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr adaptive_kind_name(AdaptiveKind kind) {
  switch (kind) {
  case AdaptiveKind::Volatility:
    return "volatility"_kj;
  case AdaptiveKind::Regime:
    return "regime"_kj;
  case AdaptiveKind::Bounded:
    return "bounded"_kj;
  }
  KJ_UNREACHABLE;
}

Tier3AstMutator::Tier3AstMutator(const Tier3Config& config, uint64_t seed, core::Logger& logger,
                                 const strategy::FactorRegistry& registry)
    : config_(config), logger_(logger), registry_(registry), random_(seed) {
  if (config_.mutation_probability < 0.0 || config_.mutation_probability > 1.0) {
    throw core::ConfigException(kj::str("tier3.mutation_probability must be in [0, 1], got ",
                                        config_.mutation_probability));
  }
  if (!(config_.threshold_scale > 0.0 && config_.threshold_scale < 1.0)) {
    throw core::ConfigException(
        kj::str("tier3.threshold_scale must be in (0, 1), got ", config_.threshold_scale));
  }
}

size_t Tier3AstMutator::count_eligible(snippet::Module& module, AstTransform transform) {
  if (transform == AstTransform::AdaptiveParameter) {
    return adaptive_candidates(module).size();
  }
  return collect(module, transform).size();
}

bool Tier3AstMutator::make_adaptive(snippet::Module& module, kj::StringPtr param,
                                    AdaptiveKind kind, kj::Maybe<AdaptiveBounds> bounds) {
  auto* def = first_function(module);
  if (def == nullptr || def->params.size() == 0 || !reads_name(*def, param) ||
      rebinds_name(*def, param)) {
    return false;
  }
  auto maybe_base = numeric_default(*def, param);
  const Expr* base = nullptr;
  KJ_IF_SOME(b, maybe_base) {
    base = &b;
  } else {
    return false;
  }

  AdaptiveBounds range{base->number * 0.5, base->number * 1.5};
  KJ_IF_SOME(b, bounds) {
    range = b;
  }
  if (kind == AdaptiveKind::Bounded) {
    if (!(range.min < range.max)) {
      throw core::ValidationException(kj::str("Adaptive bounds for '", param, "' are empty: [",
                                              range.min, ", ", range.max, "]"));
    }
    if (base->number < range.min || base->number > range.max) {
      throw core::ValidationException(kj::str("Default of '", param, "' (", base->number,
                                              ") is outside [", range.min, ", ", range.max, "]"));
    }
  }

  auto source = adaptive_source(def->params[0].name, param, base->is_integer, kind, range);
  auto prelude = snippet::parse_or_throw(source);
  kj::Vector<snippet::StmtPtr> body(prelude.body.size() + def->body.size());
  for (auto& stmt : prelude.body) {
    body.add(kj::mv(stmt));
  }
  for (auto& stmt : def->body) {
    body.add(kj::mv(stmt));
  }
  def->body = kj::mv(body);
  return true;
}

size_t Tier3AstMutator::apply_transform(snippet::Module& module, AstTransform transform,
                                        core::Random& random,
                                        kj::Maybe<const strategy::FactorDefinition&> definition) const {
  if (transform == AstTransform::AdaptiveParameter) {
    auto candidates = adaptive_candidates(module);
    if (candidates.empty()) {
      return 0;
    }
    kj::StringPtr param = candidates[random.uniform_index(candidates.size())];
    auto kind = kAdaptiveKinds[random.uniform_index(kj::size(kAdaptiveKinds))];
    kj::Maybe<AdaptiveBounds> bounds;
    KJ_IF_SOME(def, definition) {
      KJ_IF_SOME(pdef, def.find_parameter(param)) {
        bounds = AdaptiveBounds{pdef.min, pdef.max};
      }
    }
    try {
      if (!make_adaptive(module, param, kind, bounds)) {
        return 0;
      }
    } catch (const core::ValidationException& e) {
      logger_.debug(kj::str("Tier3 skipped adaptive parameter ", param, ": ", e.message()));
      return 0;
    }
    logger_.debug(kj::str("Tier3 ", adaptive_kind_name(kind), "-adaptive parameter ", param));
    return 1;
  }

  auto nodes = collect(module, transform);
  if (nodes.empty()) {
    return 0;
  }

  kj::Vector<bool> chosen(nodes.size());
  size_t picked = 0;
  for (size_t i = 0; i < nodes.size(); ++i) {
    bool pick = random.bernoulli(config_.mutation_probability);
    chosen.add(pick);
    picked += pick ? 1 : 0;
  }
  if (picked == 0) {
    chosen[random.uniform_index(nodes.size())] = true;
  }

  size_t count = 0;
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (!chosen[i]) {
      continue;
    }
    auto& expr = *nodes[i];
    switch (transform) {
    case AstTransform::OperatorMutation:
      for (auto& op : expr.compare_ops) {
        op = swap(op);
      }
      ++count;
      break;
    case AstTransform::ThresholdAdjustment: {
      double factor =
          1.0 + random.uniform(-config_.threshold_scale, config_.threshold_scale);
      double value = expr.number * factor;
      if (expr.is_integer) {
        // Rounding can land back on the original; step one unit instead
        value = std::round(value);
        if (value == expr.number) {
          value += factor < 1.0 ? -1.0 : 1.0;
        }
        if (expr.number >= 1.0 && value < 1.0) {
          value = expr.number + 1.0;
        }
      }
      if (value == expr.number) {
        break;
      }
      expr.number = value;
      expr.text = kj::String();
      ++count;
      break;
    }
    case AstTransform::ExpressionModification:
      expr.binary_op = swap(expr.binary_op);
      ++count;
      break;
    case AstTransform::AdaptiveParameter:
      break;
    }
  }
  return count;
}

TierResult Tier3AstMutator::mutate(const strategy::Strategy& input,
                                   const MutationRequest& request) {
  auto factors = input.factors();
  if (factors.size() == 0) {
    return TierFailure{kj::str("Strategy has no factors to rewrite"),
                       kj::str("ast_mutation")};
  }

  auto random = random_.lockExclusive();
  size_t index = random->uniform_index(factors.size());
  auto& factor = factors[index];

  auto parsed = snippet::parse(factor.logic);
  KJ_IF_SOME(error, parsed.tryGet<snippet::SyntaxError>()) {
    return TierFailure{
        kj::str("Logic of factor '", factor.id, "' does not parse: ", error.message),
        kj::str("ast_mutation")};
  }
  auto& module = parsed.get<snippet::Module>();

  // A requested transform is tried alone; otherwise all of them in random order.
  kj::Vector<AstTransform> order;
  KJ_IF_SOME(requested, request.mutation_type) {
    for (auto t : kTransforms) {
      if (mutation_type_name(t) == requested) {
        order.add(t);
      }
    }
  }
  if (order.empty()) {
    for (auto t : kTransforms) {
      order.add(t);
    }
    for (size_t i = order.size() - 1; i > 0; --i) {
      size_t j = random->uniform_index(i + 1);
      auto tmp = order[i];
      order[i] = order[j];
      order[j] = tmp;
    }
  }

  kj::Maybe<AstTransform> applied;
  size_t changed = 0;
  for (auto t : order) {
    changed = apply_transform(module, t, *random, registry_.find(factor.type));
    if (changed > 0) {
      applied = t;
      break;
    }
  }

  AstTransform transform = AstTransform::OperatorMutation;
  KJ_IF_SOME(t, applied) {
    transform = t;
  } else {
    return TierFailure{
        kj::str("No applicable AST transform in logic of factor '", factor.id, "'"),
        kj::str("ast_mutation")};
  }
  auto type = mutation_type_name(transform);

  auto code = snippet::print(module);
  auto validation = validator_.validate(code);
  if (!validation.success) {
    return TierFailure{kj::str("AST validation failed: ", validation.summary()), kj::str(type)};
  }
  KJ_IF_SOME(error, snippet::check_syntax(code)) {
    return TierFailure{kj::str("Rewritten logic does not compile: ", error.message, " at line ",
                               error.line),
                       kj::str(type)};
  }

  auto rewritten = factor.clone();
  rewritten.logic = kj::mv(code);
  auto logic_check = rewritten.validate_logic();
  if (!logic_check.success) {
    return TierFailure{kj::str("Rewritten logic rejected: ", logic_check.summary()),
                       kj::str(type)};
  }

  auto copy = input.clone();
  copy.mutable_factors()[index] = kj::mv(rewritten);
  auto strategy_check = copy.validate();
  if (!strategy_check.success) {
    return TierFailure{kj::str("Strategy invalid after AST rewrite: ", strategy_check.summary()),
                       kj::str(type)};
  }

  logger_.debug(kj::str("Tier3 ", type, " changed ", changed, " node(s) in factor ",
                        factor.id));

  Metadata metadata;
  set_metadata(metadata, "factor_id"_kj, kj::str(factor.id));
  set_metadata(metadata, "transform"_kj, kj::str(type));
  set_metadata(metadata, "nodes_changed"_kj, kj::str(changed));
  return TierSuccess{kj::mv(copy), kj::str(type), kj::mv(metadata)};
}

} // namespace evoguard::mutation
