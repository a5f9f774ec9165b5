#include "evoguard/core/error.h"
#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/smart_mutation_engine.h"
#include "evoguard/mutation/tier1_config_mutator.h"
#include "evoguard/mutation/tier2_operators.h"
#include "evoguard/mutation/tier3_ast_mutator.h"
#include "evoguard/snippet/data_provider.h"
#include "evoguard/snippet/interpreter.h"
#include "evoguard/snippet/parser.h"
#include "evoguard/snippet/printer.h"
#include "kj/test.h"

#include <cmath>
#include <kj/debug.h>

using namespace evoguard::mutation;
using evoguard::strategy::Strategy;

namespace {

evoguard::core::Logger& quiet_logger() {
  static evoguard::core::Logger logger(kj::heap<evoguard::core::TextFormatter>(),
                                       kj::heap<evoguard::core::MemoryOutput>());
  return logger;
}

size_t changed_parameters(const Strategy& before, const Strategy& after) {
  size_t changed = 0;
  KJ_ASSERT(before.factors().size() == after.factors().size());
  for (size_t i = 0; i < before.factors().size(); ++i) {
    auto& a = before.factors()[i];
    auto& b = after.factors()[i];
    KJ_EXPECT(a.id == b.id);
    KJ_EXPECT(a.logic == b.logic);
    for (auto& entry : a.parameters) {
      auto other = b.parameter(entry.key);
      auto& value = KJ_ASSERT_NONNULL(other, entry.key);
      if (value != entry.value) {
        ++changed;
      }
    }
  }
  return changed;
}

kj::Maybe<Strategy> apply_until_success(IMutationOperator& op, const Strategy& input,
                                        uint64_t seed) {
  evoguard::core::Random random(seed);
  for (int i = 0; i < 20; ++i) {
    auto result = op.apply(input, random);
    KJ_IF_SOME(mutated, result.tryGet<Strategy>()) {
      return kj::mv(mutated);
    }
  }
  return kj::none;
}

KJ_TEST("Tier1ConfigMutator: Changes exactly one parameter") {
  Tier1ConfigMutator mutator(5, evoguard::strategy::FactorRegistry::builtin(), quiet_logger());
  KJ_EXPECT(mutator.tier() == Tier::Config);
  auto input = evoguard::strategy::make_default_strategy();

  size_t successes = 0;
  for (int i = 0; i < 20; ++i) {
    auto result = mutator.mutate(input, MutationRequest());
    KJ_IF_SOME(success, result.tryGet<TierSuccess>()) {
      ++successes;
      KJ_EXPECT(success.mutation_type == Tier1ConfigMutator::kMutationType);
      KJ_EXPECT(changed_parameters(input, success.strategy) == 1);
      KJ_EXPECT(success.strategy.exit_code() == input.exit_code());
      auto check = success.strategy.validate();
      KJ_EXPECT(check.success, check.summary());
    }
  }
  KJ_EXPECT(successes > 0);
}

KJ_TEST("Tier1ConfigMutator: replace_parameter edits one leaf") {
  auto input = evoguard::strategy::make_default_strategy();
  auto json = Tier1ConfigMutator::replace_parameter(input.to_config_json(), 0, "window"_kj, 33);
  auto rebuilt = Strategy::from_config_json(json);
  auto window = rebuilt.factors()[0].parameter("window"_kj);
  KJ_EXPECT(KJ_ASSERT_NONNULL(window) == 33.0);
  KJ_EXPECT(changed_parameters(input, rebuilt) == 1);
  KJ_EXPECT(rebuilt.exit_code() == input.exit_code());
}

KJ_TEST("Tier1ConfigMutator: Strategy without parameters fails") {
  Tier1ConfigMutator mutator(5, evoguard::strategy::FactorRegistry::builtin(), quiet_logger());
  Strategy empty(kj::str("empty"), {}, kj::str(evoguard::strategy::default_exit_code()));
  auto result = mutator.mutate(empty, MutationRequest());
  KJ_EXPECT(result.is<TierFailure>());
}

KJ_TEST("Tier2 operators: Add, remove and replace") {
  auto& registry = evoguard::strategy::FactorRegistry::builtin();
  auto input = evoguard::strategy::make_default_strategy();

  AddFactorOperator add(registry);
  auto added = apply_until_success(add, input, 1);
  KJ_IF_SOME(s, added) {
    KJ_EXPECT(s.factors().size() == 3);
    KJ_EXPECT(s.validate().success);
  } else {
    KJ_FAIL_EXPECT("add_factor never applied");
  }

  RemoveFactorOperator remove;
  auto removed = apply_until_success(remove, input, 2);
  KJ_IF_SOME(s, removed) {
    KJ_ASSERT(s.factors().size() == 1);
    KJ_EXPECT(s.factors()[0].id == "momentum_1");
  } else {
    KJ_FAIL_EXPECT("remove_factor never applied");
  }

  ReplaceFactorOperator replace(registry);
  auto replaced = apply_until_success(replace, input, 3);
  KJ_IF_SOME(s, replaced) {
    KJ_EXPECT(s.factors().size() == 2);
    KJ_EXPECT(s.validate().success, s.validate().summary());
  } else {
    KJ_FAIL_EXPECT("replace_factor never applied");
  }
}

KJ_TEST("Tier2 operators: Refusals are reported, not thrown") {
  auto& registry = evoguard::strategy::FactorRegistry::builtin();
  kj::Vector<evoguard::strategy::Factor> one;
  one.add(registry.create("momentum"_kj, "momentum_1"_kj));
  Strategy single(kj::str("single"), kj::mv(one), kj::str(evoguard::strategy::default_exit_code()));

  evoguard::core::Random random(4);
  RemoveFactorOperator remove;
  auto result = remove.apply(single, random);
  KJ_IF_SOME(error, result.tryGet<kj::String>()) {
    KJ_EXPECT(error.contains("Cannot remove factor"_kj), error);
  } else {
    KJ_FAIL_EXPECT("removing the only factor must be refused");
  }

  AddFactorOperator capped(registry, 2);
  auto full = capped.apply(evoguard::strategy::make_default_strategy(), random);
  KJ_EXPECT(full.is<kj::String>());
}

KJ_TEST("Tier2 operators: Parameter mutation respects registry bounds") {
  auto& registry = evoguard::strategy::FactorRegistry::builtin();
  ParameterMutationOperator op(registry, 3.0);
  auto input = evoguard::strategy::make_default_strategy();
  evoguard::core::Random random(6);
  for (int i = 0; i < 30; ++i) {
    auto result = op.apply(input, random);
    KJ_IF_SOME(s, result.tryGet<Strategy>()) {
      for (auto& factor : s.factors()) {
        auto found = registry.find(factor.type);
        auto& def = KJ_ASSERT_NONNULL(found);
        for (auto& pdef : def.parameters) {
          auto value = factor.parameter(pdef.name);
          KJ_EXPECT(pdef.contains(KJ_ASSERT_NONNULL(value)), factor.id, pdef.name);
        }
      }
    }
  }
}

KJ_TEST("Tier2 operators: Unique factor ids") {
  auto input = evoguard::strategy::make_default_strategy();
  KJ_EXPECT(unique_factor_id(input, "momentum"_kj) == "momentum_2");
  KJ_EXPECT(unique_factor_id(input, "rsi"_kj) == "rsi_1");
  KJ_EXPECT(make_default_operators().size() == 4);
}

KJ_TEST("SmartMutationEngine: Named operator and statistics") {
  auto engine = SmartMutationEngine::with_default_operators(
      SchedulerConfig(), 8, evoguard::strategy::FactorRegistry::builtin(), quiet_logger());
  KJ_EXPECT(engine->tier() == Tier::Domain);
  auto input = evoguard::strategy::make_default_strategy();

  MutationRequest request;
  request.operator_name = "remove_factor"_kj;
  auto result = engine->mutate(input, request);
  KJ_IF_SOME(success, result.tryGet<TierSuccess>()) {
    KJ_EXPECT(success.mutation_type == "remove_factor");
    KJ_EXPECT(success.strategy.factors().size() == 1);
  } else {
    KJ_FAIL_EXPECT("remove_factor should apply to the default strategy");
  }

  request.operator_name = "crossover"_kj;
  auto unknown = engine->mutate(input, request);
  KJ_IF_SOME(failure, unknown.tryGet<TierFailure>()) {
    KJ_EXPECT(failure.error.contains("Unknown Tier2 operator"_kj));
  } else {
    KJ_FAIL_EXPECT("unknown operator must fail");
  }

  auto stats = engine->get_statistics();
  KJ_EXPECT(stats.total_attempts == 1);
  KJ_EXPECT(stats.total_successes == 1);
  engine->reset_statistics();
  KJ_EXPECT(engine->get_statistics().total_attempts == 0);
}

KJ_TEST("SmartMutationEngine: Distribution covers every operator") {
  auto engine = SmartMutationEngine::with_default_operators(
      SchedulerConfig(), 8, evoguard::strategy::FactorRegistry::builtin(), quiet_logger());
  for (int generation : {0, 40, 90}) {
    auto probs = engine->get_current_probabilities(generation);
    KJ_EXPECT(probs.size() == 4);
    double total = 0.0;
    for (auto& entry : probs) {
      total += entry.value;
    }
    KJ_EXPECT(std::abs(total - 1.0) < 1e-6);
  }

  auto names = engine->operator_names();
  for (int i = 0; i < 20; ++i) {
    auto picked = engine->select_operator(i);
    bool known = false;
    for (auto name : names) {
      known = known || name == picked;
    }
    KJ_EXPECT(known, picked);
  }
}

KJ_TEST("SmartMutationEngine: Initial table must match the operator set") {
  kj::Vector<kj::Own<IMutationOperator>> ops;
  ops.add(kj::heap<RemoveFactorOperator>());
  bool caught = false;
  try {
    SmartMutationEngine engine(ops.releaseAsArray(), SchedulerConfig());
  } catch (const evoguard::core::ConfigException& e) {
    caught = true;
    KJ_EXPECT(e.message().contains("not found in operator set"_kj));
  }
  KJ_EXPECT(caught);
}

KJ_TEST("Tier3AstMutator: Operator mutation rewrites comparisons") {
  Tier3AstMutator mutator(Tier3Config(), 9, quiet_logger());
  auto module = evoguard::snippet::parse_or_throw("def compute(data, window=20):\n"
                                                  "    return data.get('close') > 1.5\n"_kj);
  evoguard::core::Random random(1);
  auto changed = mutator.apply_transform(module, AstTransform::OperatorMutation, random);
  KJ_EXPECT(changed >= 1);
  auto code = evoguard::snippet::print(module);
  KJ_EXPECT(code.contains(">= 1.5"_kj), code);
}

KJ_TEST("Tier3AstMutator: Transforms without targets change nothing") {
  auto module = evoguard::snippet::parse_or_throw("def compute(data, window=20):\n"
                                                  "    return data.get('close') > 1.5\n"_kj);
  KJ_EXPECT(Tier3AstMutator::count_eligible(module, AstTransform::ExpressionModification) == 0);
  KJ_EXPECT(Tier3AstMutator::count_eligible(module, AstTransform::OperatorMutation) == 1);
  KJ_EXPECT(mutation_type_name(AstTransform::ThresholdAdjustment) == "ast_threshold_adjustment");
}

KJ_TEST("Tier3AstMutator: Rewrites one factor and keeps the structure") {
  Tier3AstMutator mutator(Tier3Config(), 9, quiet_logger());
  KJ_EXPECT(mutator.tier() == Tier::Ast);
  auto input = evoguard::strategy::make_default_strategy();

  MutationRequest request;
  request.mutation_type = "ast_operator_mutation"_kj;
  auto result = mutator.mutate(input, request);
  KJ_IF_SOME(success, result.tryGet<TierSuccess>()) {
    KJ_EXPECT(success.mutation_type == "ast_operator_mutation");
    auto factors = success.strategy.factors();
    KJ_ASSERT(factors.size() == 2);
    size_t rewritten = 0;
    for (size_t i = 0; i < factors.size(); ++i) {
      KJ_EXPECT(factors[i].id == input.factors()[i].id);
      if (factors[i].logic != input.factors()[i].logic) {
        ++rewritten;
        KJ_EXPECT(factors[i].validate_logic().success);
      }
    }
    KJ_EXPECT(rewritten == 1);
  } else {
    KJ_FAIL_EXPECT("comparison rewrite should apply", result.get<TierFailure>().error);
  }

  Strategy empty(kj::str("empty"), {}, kj::str(evoguard::strategy::default_exit_code()));
  KJ_EXPECT(mutator.mutate(empty, request).is<TierFailure>());
}

KJ_TEST("Tier3AstMutator: Every built-in factor type gets changed logic") {
  auto& registry = evoguard::strategy::FactorRegistry::builtin();
  constexpr AstTransform kAll[] = {AstTransform::OperatorMutation, AstTransform::ThresholdAdjustment,
                                   AstTransform::ExpressionModification,
                                   AstTransform::AdaptiveParameter};
  for (auto type : registry.types()) {
    size_t successes = 0;
    for (auto transform : kAll) {
      for (uint64_t seed = 1; seed <= 5; ++seed) {
        Tier3AstMutator mutator(Tier3Config(), seed, quiet_logger());
        kj::Vector<evoguard::strategy::Factor> factors;
        factors.add(registry.create(type, "f1"_kj));
        Strategy input(kj::str("single"), kj::mv(factors),
                       kj::str(evoguard::strategy::default_exit_code()));

        MutationRequest request;
        request.mutation_type = mutation_type_name(transform);
        auto result = mutator.mutate(input, request);
        KJ_IF_SOME(success, result.tryGet<TierSuccess>()) {
          ++successes;
          auto& before = input.factors()[0].logic;
          auto& after = success.strategy.factors()[0].logic;
          KJ_EXPECT(after != before, type, mutation_type_name(transform), after);
          KJ_EXPECT(success.strategy.factors()[0].validate_logic().success, type);
        }
      }
    }
    KJ_EXPECT(successes > 0, type);
  }
}

KJ_TEST("Tier3AstMutator: Integer constants always move") {
  Tier3Config config;
  config.mutation_probability = 1.0;
  config.threshold_scale = 0.2;
  Tier3AstMutator mutator(config, 3, quiet_logger());
  for (uint64_t seed = 1; seed <= 50; ++seed) {
    auto module = evoguard::snippet::parse_or_throw(
        "def compute(data, window=20, max_vol=0.03):\n"
        "    returns = data.get('close').pct_change(1)\n"
        "    return returns.rolling(window).std() < max_vol\n"_kj);
    evoguard::core::Random random(seed);
    KJ_EXPECT(mutator.apply_transform(module, AstTransform::ThresholdAdjustment, random) == 1);
    auto code = evoguard::snippet::print(module);
    KJ_EXPECT(!code.contains("pct_change(1)"_kj), code);
    KJ_EXPECT(!code.contains("pct_change(0)"_kj), code);
  }
}

// Adapted value of a one-parameter function that returns its parameter
double adapted_value(kj::StringPtr source, kj::StringPtr param, AdaptiveKind kind,
                     kj::Maybe<AdaptiveBounds> bounds = kj::none) {
  auto module = evoguard::snippet::parse_or_throw(source);
  KJ_ASSERT(Tier3AstMutator::make_adaptive(module, param, kind, bounds));
  auto data = evoguard::snippet::make_synthetic_ohlcv(200, 11);
  evoguard::snippet::ParamMap params;
  evoguard::snippet::Interpreter interpreter(module, *data, params);
  interpreter.run();
  evoguard::snippet::Value args[] = {evoguard::snippet::Value::data()};
  auto value = interpreter.call("compute"_kj, kj::arrayPtr(args, 1));
  KJ_ASSERT(value.is_numeric(), value.type_name());
  return value.as_number();
}

KJ_TEST("Tier3AstMutator: Adaptive parameters stay within their envelope") {
  constexpr kj::StringPtr kThreshold = "def compute(data, threshold=0.5):\n"
                                       "    return threshold\n"_kj;
  double vol = adapted_value(kThreshold, "threshold"_kj, AdaptiveKind::Volatility);
  KJ_EXPECT(vol >= 0.25 && vol <= 1.0, vol);

  double regime = adapted_value(kThreshold, "threshold"_kj, AdaptiveKind::Regime);
  KJ_EXPECT(regime >= 0.4 && regime <= 0.6, regime);

  double bounded =
      adapted_value(kThreshold, "threshold"_kj, AdaptiveKind::Bounded, AdaptiveBounds{0.2, 0.8});
  KJ_EXPECT(bounded >= 0.2 && bounded <= 0.8, bounded);

  constexpr kj::StringPtr kWindow = "def compute(data, window=3):\n"
                                    "    return window\n"_kj;
  for (auto kind : {AdaptiveKind::Volatility, AdaptiveKind::Regime, AdaptiveKind::Bounded}) {
    double window = adapted_value(kWindow, "window"_kj, kind);
    KJ_EXPECT(window >= 1.0, adaptive_kind_name(kind), window);
    KJ_EXPECT(window == std::round(window), adaptive_kind_name(kind), window);
  }
}

KJ_TEST("Tier3AstMutator: Adaptive rewrite of a factor still runs") {
  auto& registry = evoguard::strategy::FactorRegistry::builtin();
  auto data = evoguard::snippet::make_synthetic_ohlcv(150, 5);
  for (auto kind : {AdaptiveKind::Volatility, AdaptiveKind::Regime, AdaptiveKind::Bounded}) {
    for (auto type : registry.types()) {
      auto factor = registry.create(type, "f1"_kj);
      auto module = evoguard::snippet::parse_or_throw(factor.logic);
      auto found = registry.find(type);
      auto& definition = KJ_ASSERT_NONNULL(found);
      auto& first = definition.parameters[0];
      KJ_ASSERT(Tier3AstMutator::make_adaptive(module, first.name, kind,
                                               AdaptiveBounds{first.min, first.max}),
                type);
      // A parameter is rebound once
      KJ_EXPECT(!Tier3AstMutator::make_adaptive(module, first.name, kind), type);

      factor.logic = evoguard::snippet::print(module);
      KJ_EXPECT(factor.validate_logic().success, type, factor.logic);

      evoguard::snippet::ParamMap params;
      evoguard::snippet::Interpreter interpreter(module, *data, params);
      interpreter.run();
      evoguard::snippet::Value args[] = {evoguard::snippet::Value::data()};
      auto signal = interpreter.call("compute"_kj, kj::arrayPtr(args, 1));
      KJ_ASSERT(signal.is(evoguard::snippet::Value::Kind::Series), type, signal.type_name());
      KJ_EXPECT(signal.as_series().size() == 150, type);
    }
  }
}

KJ_TEST("Tier3AstMutator: Adaptive rewrite needs a numeric keyword that is read") {
  auto module = evoguard::snippet::parse_or_throw("def compute(data, window=20, label='x'):\n"
                                                  "    return data.get('close') > 1.0\n"_kj);
  KJ_EXPECT(!Tier3AstMutator::make_adaptive(module, "window"_kj, AdaptiveKind::Volatility));
  KJ_EXPECT(!Tier3AstMutator::make_adaptive(module, "label"_kj, AdaptiveKind::Volatility));
  KJ_EXPECT(!Tier3AstMutator::make_adaptive(module, "data"_kj, AdaptiveKind::Volatility));
  KJ_EXPECT(Tier3AstMutator::count_eligible(module, AstTransform::AdaptiveParameter) == 0);

  auto bounded = evoguard::snippet::parse_or_throw("def compute(data, threshold=0.5):\n"
                                                   "    return threshold\n"_kj);
  KJ_EXPECT(Tier3AstMutator::count_eligible(bounded, AstTransform::AdaptiveParameter) == 1);
  auto rejected = [&](AdaptiveBounds bounds) {
    try {
      Tier3AstMutator::make_adaptive(bounded, "threshold"_kj, AdaptiveKind::Bounded, bounds);
    } catch (const evoguard::core::ValidationException&) {
      return true;
    }
    return false;
  };
  KJ_EXPECT(rejected(AdaptiveBounds{0.8, 0.2}));
  KJ_EXPECT(rejected(AdaptiveBounds{0.6, 0.9}));
  KJ_EXPECT(mutation_type_name(AstTransform::AdaptiveParameter) == "ast_adaptive_parameter");
}

KJ_TEST("Tier3AstMutator: Invalid configuration") {
  Tier3Config config;
  config.threshold_scale = 1.5;
  bool caught = false;
  try {
    Tier3AstMutator mutator(config);
  } catch (const evoguard::core::ConfigException&) {
    caught = true;
  }
  KJ_EXPECT(caught);
}

} // namespace
