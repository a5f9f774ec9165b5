/**
 * @file unified_mutation_operator.h
 * @brief Top-level mutation entry point
 *
 * Each mutate() call is either an exit parameter mutation or a tier
 * mutation. The split comes from the `exit_parameter_mutation` entry of the
 * mutation probability table unless the request forces one path.
 *
 * Tier path:
 *   1. TierSelectionManager produces a MutationPlan
 *   2. the planned tier is attempted; validation runs inside the attempt
 *   3. on failure, with fallback enabled, the fixed cascade is walked:
 *        Tier 3 -> Tier 2 -> Tier 1,  Tier 2 -> Tier 1,  Tier 1 -> (none)
 *   4. the final outcome is reported once to the TierPerformanceTracker and
 *      once to the TierSelectionManager
 *
 * Usage:
 *   UnifiedMutationOperator op(EngineConfig::defaults());
 *   MutationRequest request;
 *   request.generation = 12;
 *   auto outcome = op.mutate(strategy, request);
 *   if (outcome.success) { ... evaluate outcome.strategy ... }
 *   KJ_IF_SOME(id, outcome.record_id) { op.record_performance(id, delta); }
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/exit_parameter_mutator.h"
#include "evoguard/mutation/mutation_types.h"
#include "evoguard/mutation/tier_performance_tracker.h"
#include "evoguard/mutation/tier_selection_manager.h"
#include "evoguard/security/security_validator.h"
#include "evoguard/strategy/factor.h"

#include <cstdint>
#include <kj/memory.h>
#include <kj/mutex.h>

namespace evoguard::mutation {

constexpr kj::StringPtr kExitMutationType = "exit_parameter_mutation"_kj;

struct UnifiedStatistics {
  uint64_t tier_attempts[3] = {0, 0, 0};
  uint64_t tier_successes[3] = {0, 0, 0};
  uint64_t tier_failures[3] = {0, 0, 0};
  /// Calls that needed at least one fallback step
  uint64_t fallback_count = 0;
  uint64_t exhausted_count = 0;
  uint64_t exit_attempts = 0;
  uint64_t exit_successes = 0;
  uint64_t exit_failures = 0;
  uint64_t exit_clamped = 0;
  /// mutate() calls, each counted once whatever the number of tiers tried
  uint64_t total_mutations = 0;
  uint64_t total_successes = 0;

  [[nodiscard]] double tier_success_rate(Tier tier) const;
  [[nodiscard]] double exit_success_rate() const;
  [[nodiscard]] double success_rate() const;
  [[nodiscard]] kj::String to_json(bool pretty = false) const;
};

class UnifiedMutationOperator {
public:
  /// Builds the default Tier 1, 2 and 3 mutators from `config`
  explicit UnifiedMutationOperator(const EngineConfig& config,
                                   const strategy::FactorRegistry& registry =
                                       strategy::FactorRegistry::builtin(),
                                   core::Logger& logger = core::global_logger());

  /// Explicit tier mutators; each must report the tier it is installed for
  UnifiedMutationOperator(const EngineConfig& config, kj::Own<ITierMutator> tier1,
                          kj::Own<ITierMutator> tier2, kj::Own<ITierMutator> tier3,
                          core::Logger& logger = core::global_logger());

  KJ_DISALLOW_COPY_AND_MOVE(UnifiedMutationOperator);

  /**
   * @brief Mutate `input`; never throws for mutation failures
   *
   * On failure the outcome carries an unchanged copy of `input`, the chain
   * of tiers tried and the last error.
   */
  [[nodiscard]] MutationOutcome mutate(const strategy::Strategy& input,
                                       const MutationRequest& request);

  /// Attach the evaluated fitness change to the tracker record of an outcome
  void record_performance(uint64_t record_id, double performance_delta);

  [[nodiscard]] UnifiedStatistics get_statistics() const;
  /// Clears the counters, the tracker, the learner and the exit mutator statistics
  void reset_statistics();

  [[nodiscard]] const TierPerformanceTracker& tracker() const {
    return tracker_;
  }
  [[nodiscard]] TierSelectionManager& tier_selection() {
    return selection_;
  }
  [[nodiscard]] ExitParameterMutator& exit_mutator() {
    return exit_mutator_;
  }

  /// Tiers tried after `initial` fails, in order
  [[nodiscard]] static kj::ArrayPtr<const Tier> fallback_order(Tier initial);

private:
  struct State {
    core::Random random;
    UnifiedStatistics stats;
  };

  bool choose_exit_path(const MutationRequest& request);
  MutationOutcome mutate_exit(const strategy::Strategy& input, const MutationRequest& request);
  MutationOutcome mutate_tiers(const strategy::Strategy& input, const MutationRequest& request);
  TierResult attempt(Tier tier, const strategy::Strategy& input, const MutationRequest& request);
  kj::Maybe<kj::String> validate_result(const strategy::Strategy& mutated) const;
  ITierMutator& mutator_for(Tier tier);

  MutationConfig config_;
  core::Logger& logger_;
  ExitParameterMutator exit_mutator_;
  kj::Own<ITierMutator> tiers_[3];
  TierSelectionManager selection_;
  TierPerformanceTracker tracker_;
  security::SecurityValidator security_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::mutation
