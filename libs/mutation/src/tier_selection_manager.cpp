#include "evoguard/mutation/tier_selection_manager.h"

#include <algorithm>

namespace evoguard::mutation {

namespace {

constexpr double kPriorWeight = 0.2;
constexpr double kPhaseBias = 0.1;

// Weighted position of the tier prior on the risk axis; the default
// 0.2/0.4/0.2 table sits at the neutral 0.5.
double prior_center(const MutationConfig& config) {
  double total = config.tier1_probability + config.tier2_probability + config.tier3_probability;
  if (total <= 0.0) {
    return 0.5;
  }
  return (config.tier1_probability * 0.15 + config.tier2_probability * 0.5 +
          config.tier3_probability * 0.85) /
         total;
}

} // namespace

TierSelectionManager::TierSelectionManager(const EngineConfig& config, core::Logger& logger)
    : assessor_(config.risk_weights), scheduler_(config.scheduler.clone()),
      learner_(config.adaptive_learning),
      initial_thresholds_{config.tier_router.tier1_threshold, config.tier_router.tier2_threshold},
      prior_center_(prior_center(config.mutation)), logger_(logger),
      router_(config.tier_router) {}

double TierSelectionManager::selection_risk(const strategy::Strategy& strategy,
                                            const MutationRequest& request) const {
  kj::Maybe<kj::ArrayPtr<const TierAttemptCounts>> history;
  TierAttemptCounts counts[3];
  if (learner_.total_attempts() > 0) {
    for (auto tier : kAllTiers) {
      auto perf = learner_.get_tier_performance(tier);
      counts[tier_number(tier) - 1] = TierAttemptCounts{perf.attempts, perf.successes};
    }
    history = kj::arrayPtr(counts, 3);
  }
  auto metrics = assessor_.assess_overall_risk(strategy, request.market_data, history);

  double risk = (1.0 - kPriorWeight) * metrics.overall_risk + kPriorWeight * prior_center_;
  switch (scheduler_.phase(request.generation)) {
  case GenerationPhase::Early:
    risk += kPhaseBias;
    break;
  case GenerationPhase::Mid:
    break;
  case GenerationPhase::Late:
    risk -= kPhaseBias;
    break;
  }

  auto& sched = scheduler_.config();
  if (request.diversity < sched.diversity_threshold) {
    risk += sched.diversity_boost;
  }
  risk += static_cast<double>(std::max(request.stagnation, 0) / 5) * 0.1;
  return std::clamp(risk, 0.0, 1.0);
}

MutationPlan TierSelectionManager::select_tier(const strategy::Strategy& strategy,
                                               const MutationRequest& request) const {
  double risk = selection_risk(strategy, request);
  auto plan = router_.lockShared()->route_mutation(request.intent, risk, request.override_tier);
  logger_.debug(kj::str("Tier selection for ", strategy.id(), ": ", plan.rationale));
  return plan;
}

void TierSelectionManager::record_mutation_result(int tier, bool success, double fitness_delta,
                                                  kj::StringPtr mutation_type,
                                                  kj::StringPtr strategy_id) {
  learner_.update_tier_stats(tier, success, fitness_delta, mutation_type, strategy_id);

  auto router = router_.lockExclusive();
  auto current = router->thresholds();
  auto adjustment = learner_.adjust_thresholds(current.tier1, current.tier2);
  if (adjustment.adjusted) {
    router->set_thresholds(TierThresholds{adjustment.tier1_threshold, adjustment.tier2_threshold});
    logger_.debug(kj::str("Tier thresholds adjusted to ", adjustment.tier1_threshold, " / ",
                          adjustment.tier2_threshold));
  }
}

TierThresholds TierSelectionManager::current_thresholds() const {
  return router_.lockShared()->thresholds();
}

void TierSelectionManager::reset() {
  learner_.reset_stats();
  router_.lockExclusive()->set_thresholds(initial_thresholds_);
}

} // namespace evoguard::mutation
