#include "evoguard/core/json.h"
#include "evoguard/core/logger.h"
#include "evoguard/mutation/unified_mutation_operator.h"
#include "kj/test.h"

#include <kj/debug.h>

using namespace evoguard::mutation;

namespace {

/// Tier mutator with a scripted outcome that logs every call
class ScriptedMutator final : public ITierMutator {
public:
  ScriptedMutator(Tier tier, bool succeed, kj::Vector<int>& calls)
      : tier_(tier), succeed_(succeed), calls_(calls) {}

  Tier tier() const override {
    return tier_;
  }

  TierResult mutate(const evoguard::strategy::Strategy& input,
                    const MutationRequest& request) override {
    calls_.add(tier_number(tier_));
    auto type = kj::str("scripted_tier", tier_number(tier_));
    if (!succeed_) {
      return TierFailure{kj::str(to_string(tier_), " refused"), kj::mv(type)};
    }
    auto copy = input.clone();
    copy.mutable_factors()[0].set_parameter("window"_kj, 30);
    return TierSuccess{kj::mv(copy), kj::mv(type), {}};
  }

private:
  Tier tier_;
  bool succeed_;
  kj::Vector<int>& calls_;
};

/// Throws instead of reporting a failure
class ThrowingMutator final : public ITierMutator {
public:
  explicit ThrowingMutator(Tier tier) : tier_(tier) {}

  Tier tier() const override {
    return tier_;
  }
  TierResult mutate(const evoguard::strategy::Strategy&, const MutationRequest&) override {
    KJ_FAIL_REQUIRE("mutator crashed");
  }

private:
  Tier tier_;
};

struct Harness {
  kj::Vector<int> calls;
  evoguard::core::Logger logger{kj::heap<evoguard::core::TextFormatter>(),
                                kj::heap<evoguard::core::MemoryOutput>()};
  kj::Own<UnifiedMutationOperator> op;

  Harness(bool tier1_ok, bool tier2_ok, bool tier3_ok, bool fallback = true) {
    auto config = EngineConfig::defaults();
    config.mutation.enable_fallback = fallback;
    op = kj::heap<UnifiedMutationOperator>(
        config, kj::heap<ScriptedMutator>(Tier::Config, tier1_ok, calls),
        kj::heap<ScriptedMutator>(Tier::Domain, tier2_ok, calls),
        kj::heap<ScriptedMutator>(Tier::Ast, tier3_ok, calls), logger);
  }
};

MutationRequest forced_tier(int tier) {
  MutationRequest request;
  request.override_tier = tier;
  return request;
}

bool chain_is(const MutationOutcome& outcome, std::initializer_list<int> expected) {
  if (outcome.fallback_chain.size() != expected.size()) {
    return false;
  }
  size_t i = 0;
  for (int tier : expected) {
    if (outcome.fallback_chain[i++] != tier) {
      return false;
    }
  }
  return true;
}

KJ_TEST("UnifiedMutationOperator: Exhausted cascade reports every tier") {
  Harness h(false, false, false);
  auto input = evoguard::strategy::make_default_strategy();
  auto outcome = h.op->mutate(input, forced_tier(3));

  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(chain_is(outcome, {3, 2, 1}), format_chain(outcome.fallback_chain.asPtr()));
  KJ_IF_SOME(error, outcome.error) {
    KJ_EXPECT(error == "All fallback tiers failed. Attempted: [3, 2, 1]", error);
  } else {
    KJ_FAIL_EXPECT("exhausted cascade must report an error");
  }
  KJ_EXPECT(outcome.strategy.to_config_json() == input.to_config_json());

  auto stats = h.op->get_statistics();
  KJ_EXPECT(stats.fallback_count == 1);
  KJ_EXPECT(stats.exhausted_count == 1);
  KJ_EXPECT(stats.tier_failures[0] == 1 && stats.tier_failures[1] == 1 &&
            stats.tier_failures[2] == 1);
  KJ_EXPECT(stats.total_mutations == 1);
  KJ_EXPECT(h.op->tracker().size() == 1);
}

KJ_TEST("UnifiedMutationOperator: Tier 2 is tried before Tier 1") {
  Harness h(true, false, false);
  auto outcome = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(3));

  KJ_EXPECT(outcome.success);
  KJ_EXPECT(outcome.tier_used == 1);
  KJ_EXPECT(outcome.mutation_type == "scripted_tier1");
  KJ_ASSERT(h.calls.size() == 3);
  KJ_EXPECT(h.calls[0] == 3 && h.calls[1] == 2 && h.calls[2] == 1);
  KJ_EXPECT(chain_is(outcome, {3, 2, 1}));
}

KJ_TEST("UnifiedMutationOperator: Cascade stops at the first success") {
  Harness h(true, true, false);
  auto outcome = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(3));
  KJ_EXPECT(outcome.success);
  KJ_EXPECT(outcome.tier_used == 2);
  KJ_EXPECT(chain_is(outcome, {3, 2}));
  KJ_EXPECT(h.calls.size() == 2);
}

KJ_TEST("UnifiedMutationOperator: Shorter cascades") {
  Harness from2(false, false, true);
  auto outcome = from2.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(2));
  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(chain_is(outcome, {2, 1}));

  Harness from1(false, true, true);
  auto single = from1.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(1));
  KJ_EXPECT(!single.success);
  KJ_EXPECT(chain_is(single, {1}));
  KJ_IF_SOME(error, single.error) {
    KJ_EXPECT(error.contains("refused"_kj), error);
  } else {
    KJ_FAIL_EXPECT("failed mutation must report an error");
  }
  KJ_EXPECT(from1.op->get_statistics().fallback_count == 0);
}

KJ_TEST("UnifiedMutationOperator: Fallback can be disabled") {
  Harness h(true, true, false, false);
  auto outcome = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(3));
  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(chain_is(outcome, {3}));
  KJ_EXPECT(h.calls.size() == 1);
}

KJ_TEST("UnifiedMutationOperator: Fallback order") {
  auto from3 = UnifiedMutationOperator::fallback_order(Tier::Ast);
  KJ_ASSERT(from3.size() == 2);
  KJ_EXPECT(from3[0] == Tier::Domain && from3[1] == Tier::Config);
  KJ_EXPECT(UnifiedMutationOperator::fallback_order(Tier::Domain).size() == 1);
  KJ_EXPECT(UnifiedMutationOperator::fallback_order(Tier::Config).size() == 0);
  int chain[] = {3, 2, 1};
  KJ_EXPECT(format_chain(kj::arrayPtr(chain, 3)) == "[3, 2, 1]");
}

KJ_TEST("UnifiedMutationOperator: A throwing mutator counts as a failed tier") {
  kj::Vector<int> calls;
  evoguard::core::Logger logger(kj::heap<evoguard::core::TextFormatter>(),
                                kj::heap<evoguard::core::MemoryOutput>());
  UnifiedMutationOperator op(EngineConfig::defaults(),
                             kj::heap<ScriptedMutator>(Tier::Config, true, calls),
                             kj::heap<ScriptedMutator>(Tier::Domain, false, calls),
                             kj::heap<ThrowingMutator>(Tier::Ast), logger);
  auto outcome = op.mutate(evoguard::strategy::make_default_strategy(), forced_tier(3));
  KJ_EXPECT(outcome.success);
  KJ_EXPECT(outcome.tier_used == 1);
  KJ_EXPECT(op.get_statistics().tier_failures[2] == 1);
}

KJ_TEST("UnifiedMutationOperator: Mismatched tier mutator is a configuration error") {
  kj::Vector<int> calls;
  bool caught = false;
  try {
    UnifiedMutationOperator op(EngineConfig::defaults(),
                               kj::heap<ScriptedMutator>(Tier::Domain, true, calls),
                               kj::heap<ScriptedMutator>(Tier::Domain, true, calls),
                               kj::heap<ScriptedMutator>(Tier::Ast, true, calls));
  } catch (const evoguard::core::ConfigException&) {
    caught = true;
  }
  KJ_EXPECT(caught);
}

KJ_TEST("UnifiedMutationOperator: Invalid override is a failed outcome") {
  Harness h(true, true, true);
  auto outcome = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(5));
  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(outcome.error != kj::none);
  KJ_EXPECT(outcome.record_id == kj::none);
  KJ_EXPECT(h.calls.size() == 0);
}

KJ_TEST("UnifiedMutationOperator: Exit mutation path") {
  Harness h(true, true, true);
  auto input = evoguard::strategy::make_default_strategy();
  MutationRequest request;
  request.mutation_type = kExitMutationType;
  request.exit_parameter = "take_profit_pct"_kj;

  auto outcome = h.op->mutate(input, request);
  KJ_EXPECT(outcome.success);
  KJ_EXPECT(outcome.tier_used == 0);
  KJ_EXPECT(outcome.mutation_type == kExitMutationType);
  KJ_EXPECT(outcome.record_id == kj::none);
  KJ_EXPECT(outcome.strategy.exit_code() != input.exit_code());
  KJ_EXPECT(outcome.strategy.to_config_json() != input.to_config_json());
  KJ_EXPECT(h.calls.size() == 0);

  auto found = outcome.metadata.find("parameter_name"_kj);
  auto& name = KJ_ASSERT_NONNULL(found);
  KJ_EXPECT(name == "take_profit_pct");

  auto stats = h.op->get_statistics();
  KJ_EXPECT(stats.exit_attempts == 1);
  KJ_EXPECT(stats.exit_successes == 1);
  KJ_EXPECT(h.op->tracker().size() == 0);
}

KJ_TEST("UnifiedMutationOperator: Failed exit mutation keeps the strategy") {
  Harness h(true, true, true);
  auto input = evoguard::strategy::make_default_strategy();
  input.set_exit_code(kj::str("max_positions = 3\n"));
  MutationRequest request;
  request.mutation_type = kExitMutationType;

  auto outcome = h.op->mutate(input, request);
  KJ_EXPECT(!outcome.success);
  KJ_EXPECT(outcome.strategy.exit_code() == "max_positions = 3\n");
  KJ_EXPECT(h.op->get_statistics().exit_failures == 1);
}

KJ_TEST("UnifiedMutationOperator: Probability table splits exit and tier paths") {
  Harness h(true, true, true);
  auto input = evoguard::strategy::make_default_strategy();
  MutationRequest request;
  request.generation = 50;
  for (int i = 0; i < 200; ++i) {
    auto outcome = h.op->mutate(input, request);
  }
  auto stats = h.op->get_statistics();
  uint64_t tier_calls = h.calls.size();
  KJ_EXPECT(stats.total_mutations == 200);
  KJ_EXPECT(stats.exit_attempts + tier_calls == 200);
  // Exit share is 0.2 of the table
  KJ_EXPECT(stats.exit_attempts > 15 && stats.exit_attempts < 80, stats.exit_attempts);
  KJ_EXPECT(h.op->tracker().size() == tier_calls);
}

KJ_TEST("UnifiedMutationOperator: Performance is attached to the tracker record") {
  Harness h(true, true, true);
  auto outcome = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(2));
  KJ_ASSERT(outcome.success);
  auto id = KJ_ASSERT_NONNULL(outcome.record_id);
  h.op->record_performance(id, 0.25);
  KJ_EXPECT(h.op->tracker().get_tier_summary(Tier::Domain).avg_improvement == 0.25);
}

KJ_TEST("UnifiedMutationOperator: Statistics document and reset") {
  Harness h(false, true, true);
  auto ok = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(2));
  auto bad = h.op->mutate(evoguard::strategy::make_default_strategy(), forced_tier(1));

  auto stats = h.op->get_statistics();
  KJ_EXPECT(stats.total_successes == 1);
  KJ_EXPECT(stats.success_rate() == 0.5);
  KJ_EXPECT(stats.tier_success_rate(Tier::Domain) == 1.0);

  auto doc = evoguard::core::JsonDocument::parse(stats.to_json());
  KJ_EXPECT(doc.root()["total_mutations"_kj].get_int() == 2);
  KJ_EXPECT(doc.root()["tiers"_kj]["1"_kj]["failures"_kj].get_int() == 1);

  h.op->reset_statistics();
  KJ_EXPECT(h.op->get_statistics().total_mutations == 0);
  KJ_EXPECT(h.op->tracker().size() == 0);
}

KJ_TEST("UnifiedMutationOperator: Default mutators produce valid strategies") {
  evoguard::core::Logger logger(kj::heap<evoguard::core::TextFormatter>(),
                                kj::heap<evoguard::core::MemoryOutput>());
  UnifiedMutationOperator op(EngineConfig::defaults(),
                             evoguard::strategy::FactorRegistry::builtin(), logger);
  auto input = evoguard::strategy::make_default_strategy();

  size_t successes = 0;
  for (int i = 0; i < 40; ++i) {
    MutationRequest request;
    request.generation = i;
    auto outcome = op.mutate(input, request);
    if (outcome.success) {
      ++successes;
      auto check = outcome.strategy.validate();
      KJ_EXPECT(check.success, check.summary());
    }
  }
  KJ_EXPECT(successes > 20, successes);

  auto stats = op.get_statistics();
  for (auto tier : kAllTiers) {
    int i = tier_number(tier) - 1;
    KJ_EXPECT(stats.tier_attempts[i] == stats.tier_successes[i] + stats.tier_failures[i]);
  }
}

} // namespace
