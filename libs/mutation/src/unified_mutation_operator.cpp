#include "evoguard/mutation/unified_mutation_operator.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/mutation/smart_mutation_engine.h"
#include "evoguard/mutation/tier1_config_mutator.h"
#include "evoguard/mutation/tier3_ast_mutator.h"

#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

constexpr Tier kFallbackFromAst[] = {Tier::Domain, Tier::Config};
constexpr Tier kFallbackFromDomain[] = {Tier::Config};

double rate(uint64_t part, uint64_t whole) {
  return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole);
}

} // namespace

double UnifiedStatistics::tier_success_rate(Tier tier) const {
  int i = tier_number(tier) - 1;
  return rate(tier_successes[i], tier_attempts[i]);
}

double UnifiedStatistics::exit_success_rate() const {
  return rate(exit_successes, exit_attempts);
}

double UnifiedStatistics::success_rate() const {
  return rate(total_successes, total_mutations);
}

kj::String UnifiedStatistics::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put_object("tiers", [&](core::JsonBuilder& tiers) {
    for (auto tier : kAllTiers) {
      int i = tier_number(tier) - 1;
      tiers.put_object(kj::str(tier_number(tier)), [&](core::JsonBuilder& t) {
        t.put("attempts", tier_attempts[i]);
        t.put("successes", tier_successes[i]);
        t.put("failures", tier_failures[i]);
        t.put("success_rate", tier_success_rate(tier));
      });
    }
  });
  builder.put_object("exit_mutation", [&](core::JsonBuilder& exit) {
    exit.put("attempts", exit_attempts);
    exit.put("successes", exit_successes);
    exit.put("failures", exit_failures);
    exit.put("clamped", exit_clamped);
    exit.put("success_rate", exit_success_rate());
  });
  builder.put("fallback_count", fallback_count);
  builder.put("exhausted_count", exhausted_count);
  builder.put("total_mutations", total_mutations);
  builder.put("total_successes", total_successes);
  builder.put("success_rate", success_rate());
  return builder.build(pretty);
}

UnifiedMutationOperator::UnifiedMutationOperator(const EngineConfig& config,
                                                 const strategy::FactorRegistry& registry,
                                                 core::Logger& logger)
    : UnifiedMutationOperator(
          config, kj::heap<Tier1ConfigMutator>(config.seed + 1, registry, logger),
          SmartMutationEngine::with_default_operators(config.scheduler, config.seed + 2, registry,
                                                      logger),
          kj::heap<Tier3AstMutator>(config.tier3, config.seed + 3, logger, registry), logger) {}

UnifiedMutationOperator::UnifiedMutationOperator(const EngineConfig& config,
                                                 kj::Own<ITierMutator> tier1,
                                                 kj::Own<ITierMutator> tier2,
                                                 kj::Own<ITierMutator> tier3,
                                                 core::Logger& logger)
    : config_(config.mutation), logger_(logger),
      exit_mutator_(config.exit_mutation, config.seed, logger),
      tiers_{kj::mv(tier1), kj::mv(tier2), kj::mv(tier3)}, selection_(config, logger),
      state_(State{core::Random(config.seed + 4), {}}) {
  config.validate();
  for (auto tier : kAllTiers) {
    auto& mutator = *tiers_[tier_number(tier) - 1];
    if (mutator.tier() != tier) {
      throw core::ConfigException(kj::str("Mutator installed for ", to_string(tier),
                                          " reports ", to_string(mutator.tier())));
    }
  }
}

kj::ArrayPtr<const Tier> UnifiedMutationOperator::fallback_order(Tier initial) {
  switch (initial) {
  case Tier::Ast:
    return kFallbackFromAst;
  case Tier::Domain:
    return kFallbackFromDomain;
  case Tier::Config:
    return nullptr;
  }
  KJ_UNREACHABLE;
}

ITierMutator& UnifiedMutationOperator::mutator_for(Tier tier) {
  return *tiers_[tier_number(tier) - 1];
}

bool UnifiedMutationOperator::choose_exit_path(const MutationRequest& request) {
  KJ_IF_SOME(type, request.mutation_type) {
    return type == kExitMutationType;
  }
  if (request.override_tier != kj::none) {
    return false;
  }
  double total = config_.exit_probability + config_.tier1_probability +
                 config_.tier2_probability + config_.tier3_probability;
  double p = total > 0.0 ? config_.exit_probability / total : 0.0;
  return state_.lockExclusive()->random.bernoulli(p);
}

MutationOutcome UnifiedMutationOperator::mutate(const strategy::Strategy& input,
                                                const MutationRequest& request) {
  auto outcome = choose_exit_path(request) ? mutate_exit(input, request)
                                           : mutate_tiers(input, request);
  auto lock = state_.lockExclusive();
  ++lock->stats.total_mutations;
  if (outcome.success) {
    ++lock->stats.total_successes;
  }
  return outcome;
}

MutationOutcome UnifiedMutationOperator::mutate_exit(const strategy::Strategy& input,
                                                     const MutationRequest& request) {
  auto result = exit_mutator_.mutate(input.exit_code(), request.exit_parameter);

  MutationOutcome outcome;
  outcome.tier_used = 0;
  outcome.mutation_type = kj::str(kExitMutationType);
  outcome.strategy = input.clone();
  set_metadata(outcome.metadata, "parameter_name"_kj, kj::str(result.metadata.parameter_name));
  set_metadata(outcome.metadata, "old_value"_kj, kj::str(result.metadata.old_value));
  set_metadata(outcome.metadata, "new_value"_kj, kj::str(result.metadata.new_value));
  set_metadata(outcome.metadata, "clamped"_kj,
               kj::str(result.metadata.clamped ? "true" : "false"));

  auto lock = state_.lockExclusive();
  ++lock->stats.exit_attempts;
  if (!result.success) {
    ++lock->stats.exit_failures;
    KJ_IF_SOME(error, result.error) {
      logger_.warn(kj::str("Exit mutation failed: ", error));
      outcome.error = kj::str(error);
    } else {
      outcome.error = kj::str("Exit mutation failed");
    }
    return outcome;
  }

  ++lock->stats.exit_successes;
  if (result.metadata.clamped) {
    ++lock->stats.exit_clamped;
  }
  outcome.strategy.set_exit_code(kj::mv(result.mutated_code));
  outcome.success = true;
  return outcome;
}

kj::Maybe<kj::String> UnifiedMutationOperator::validate_result(
    const strategy::Strategy& mutated) const {
  auto structural = mutated.validate();
  if (!structural.success) {
    return structural.summary();
  }
  kj::Maybe<kj::String> error;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto policy = security_.validate(mutated.to_code());
               if (!policy.success) {
                 error = policy.summary();
               }
             })) {
    error = kj::str(exception.getDescription());
  }
  return error;
}

TierResult UnifiedMutationOperator::attempt(Tier tier, const strategy::Strategy& input,
                                            const MutationRequest& request) {
  int index = tier_number(tier) - 1;
  ++state_.lockExclusive()->stats.tier_attempts[index];

  kj::Maybe<TierResult> produced;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               try {
                 produced = mutator_for(tier).mutate(input, request);
               } catch (const core::EvoGuardException& e) {
                 produced = TierResult(TierFailure{kj::str(e.message()), kj::str("unknown")});
               }
             })) {
    produced = TierResult(TierFailure{kj::str(exception.getDescription()), kj::str("unknown")});
  }

  TierResult result = kj::mv(KJ_ASSERT_NONNULL(produced));
  if (config_.validate_mutations) {
    KJ_IF_SOME(success, result.tryGet<TierSuccess>()) {
      KJ_IF_SOME(error, validate_result(success.strategy)) {
        result = TierFailure{kj::str("Validation failed: ", error), kj::mv(success.mutation_type)};
      }
    }
  }

  auto lock = state_.lockExclusive();
  if (result.is<TierSuccess>()) {
    ++lock->stats.tier_successes[index];
  } else {
    ++lock->stats.tier_failures[index];
  }
  return result;
}

MutationOutcome UnifiedMutationOperator::mutate_tiers(const strategy::Strategy& input,
                                                      const MutationRequest& request) {
  MutationOutcome outcome;
  outcome.strategy = input.clone();

  kj::Maybe<MutationPlan> planned;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               try {
                 planned = selection_.select_tier(input, request);
               } catch (const core::ValidationException& e) {
                 outcome.error = kj::str(e.message());
               }
             })) {
    outcome.error = kj::str("Tier selection failed: ", exception.getDescription());
  }
  if (planned == kj::none) {
    KJ_IF_SOME(error, outcome.error) {
      logger_.warn(kj::str("Mutation of ", input.id(), " rejected: ", error));
    }
    outcome.mutation_type = kj::str("unknown");
    return outcome;
  }
  auto plan = kj::mv(KJ_ASSERT_NONNULL(planned));

  Tier initial = plan.tier;
  outcome.fallback_chain.add(tier_number(initial));
  auto result = attempt(initial, input, request);

  if (result.is<TierFailure>() && config_.enable_fallback) {
    auto order = fallback_order(initial);
    if (order.size() > 0) {
      ++state_.lockExclusive()->stats.fallback_count;
    }
    Tier failed = initial;
    for (auto next : order) {
      logger_.warn(kj::str(to_string(failed), " mutation of ", input.id(), " failed (",
                           result.get<TierFailure>().error, "), falling back to ",
                           to_string(next)));
      outcome.fallback_chain.add(tier_number(next));
      result = attempt(next, input, request);
      if (result.is<TierSuccess>()) {
        break;
      }
      failed = next;
    }
  }

  int last = outcome.fallback_chain.back();
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(success, TierSuccess) {
      outcome.success = true;
      outcome.tier_used = last;
      outcome.strategy = kj::mv(success.strategy);
      outcome.mutation_type = kj::mv(success.mutation_type);
      outcome.metadata = kj::mv(success.metadata);
    }
    KJ_CASE_ONEOF(failure, TierFailure) {
      outcome.tier_used = tier_number(initial);
      outcome.mutation_type = kj::mv(failure.mutation_type);
      if (outcome.fallback_chain.size() > 1) {
        ++state_.lockExclusive()->stats.exhausted_count;
        outcome.error = kj::str("All fallback tiers failed. Attempted: ",
                                format_chain(outcome.fallback_chain.asPtr()));
        logger_.error(kj::str("Mutation of ", input.id(), " exhausted tiers ",
                              format_chain(outcome.fallback_chain.asPtr()),
                              "; last error: ", failure.error));
      } else {
        outcome.error = kj::mv(failure.error);
      }
    }
  }
  set_metadata(outcome.metadata, "planned_tier"_kj, kj::str(tier_number(initial)));
  set_metadata(outcome.metadata, "risk_score"_kj, kj::str(plan.risk_score));
  set_metadata(outcome.metadata, "fallback_chain"_kj,
               format_chain(outcome.fallback_chain.asPtr()));

  outcome.record_id = tracker_.record(outcome.tier_used, outcome.mutation_type, outcome.success,
                                      0.0, input.id(), clone_metadata(outcome.metadata));
  selection_.record_mutation_result(outcome.tier_used, outcome.success, 0.0,
                                    outcome.mutation_type, input.id());
  return outcome;
}

void UnifiedMutationOperator::record_performance(uint64_t record_id, double performance_delta) {
  tracker_.attach_performance(record_id, performance_delta);
}

UnifiedStatistics UnifiedMutationOperator::get_statistics() const {
  return state_.lockShared()->stats;
}

void UnifiedMutationOperator::reset_statistics() {
  state_.lockExclusive()->stats = UnifiedStatistics();
  tracker_.reset();
  selection_.reset();
  exit_mutator_.reset_statistics();
}

} // namespace evoguard::mutation
