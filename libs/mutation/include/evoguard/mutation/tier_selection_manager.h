/**
 * @file tier_selection_manager.h
 * @brief Risk-based tier selection with adaptive thresholds
 *
 * select_tier() blends, in order:
 *   1. RiskAssessor overall risk (strategy, market, mutation history)
 *   2. the tier prior of the unified probability table (weight 0.2)
 *   3. a generation phase bias: +0.1 early (toward Tier 3), -0.1 late
 *      (toward Tier 1)
 *   4. the diversity and stagnation boosts of the scheduler
 * clamps the result to [0, 1] and routes it through TierRouter. Every
 * recorded outcome feeds the AdaptiveLearner, whose adjusted thresholds are
 * applied to the router once enough samples exist.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/mutation/adaptive_learner.h"
#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/mutation_scheduler.h"
#include "evoguard/mutation/mutation_types.h"
#include "evoguard/mutation/risk_assessor.h"
#include "evoguard/mutation/tier_router.h"

#include <kj/mutex.h>

namespace evoguard::mutation {

class TierSelectionManager {
public:
  /// @throws core::ConfigException on invalid weights, thresholds or scheduler settings
  explicit TierSelectionManager(const EngineConfig& config,
                                core::Logger& logger = core::global_logger());

  KJ_DISALLOW_COPY_AND_MOVE(TierSelectionManager);

  /// @throws core::ValidationException on an invalid or disabled tier override
  [[nodiscard]] MutationPlan select_tier(const strategy::Strategy& strategy,
                                         const MutationRequest& request) const;

  /// Risk score select_tier() would route, before any override
  [[nodiscard]] double selection_risk(const strategy::Strategy& strategy,
                                      const MutationRequest& request) const;

  /**
   * @brief Feed one outcome to the learner and apply adjusted thresholds
   * @throws core::ValidationException for a tier outside 1..3
   */
  void record_mutation_result(int tier, bool success, double fitness_delta = 0.0,
                              kj::StringPtr mutation_type = "unknown"_kj,
                              kj::StringPtr strategy_id = ""_kj);

  [[nodiscard]] OperatorProbabilities get_operator_probabilities(
      int generation, const SuccessRates& success_rates) const {
    return scheduler_.get_operator_probabilities(generation, success_rates);
  }
  [[nodiscard]] double get_mutation_rate(int generation, double diversity,
                                         int stagnation = 0) const {
    return scheduler_.get_mutation_rate(generation, diversity, stagnation);
  }

  [[nodiscard]] TierRecommendations get_recommendations() const {
    return learner_.get_tier_recommendations();
  }
  [[nodiscard]] TierThresholds current_thresholds() const;
  [[nodiscard]] const AdaptiveLearner& learner() const {
    return learner_;
  }
  [[nodiscard]] const RiskAssessor& risk_assessor() const {
    return assessor_;
  }

  /// Clears the learner and restores the configured thresholds
  void reset();

private:
  RiskAssessor assessor_;
  MutationScheduler scheduler_;
  AdaptiveLearner learner_;
  TierThresholds initial_thresholds_;
  double prior_center_;
  core::Logger& logger_;
  kj::MutexGuarded<TierRouter> router_;
};

} // namespace evoguard::mutation
