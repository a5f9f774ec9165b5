#pragma once

#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/mutation_types.h"

#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::mutation {

struct TierThresholds {
  double tier1;
  double tier2;
};

struct TierAttemptShares {
  double tier1;
  double tier2;
  double tier3;
};

/**
 * @brief Maps a risk score to a tier
 *
 *   risk <  tier1_threshold   Tier 1
 *   risk <  tier2_threshold   Tier 2
 *   otherwise                 Tier 3
 *
 * Risk is clamped to [0, 1] first. A manual override bypasses the thresholds
 * when allowed.
 */
class TierRouter {
public:
  /// @throws core::ConfigException unless 0 <= tier1 <= tier2 <= 1
  explicit TierRouter(const TierRouterConfig& config = TierRouterConfig());

  /// @throws core::ValidationException on a disabled or out-of-range override
  [[nodiscard]] Tier select_tier(double risk_score,
                                 kj::Maybe<int> override_tier = kj::none) const;

  /// Tier selection plus intent mapping and a rationale
  [[nodiscard]] MutationPlan route_mutation(kj::StringPtr intent, double risk_score,
                                            kj::Maybe<int> override_tier = kj::none) const;

  /**
   * @brief Thresholds nudged by per-tier success rates (0.5 is neutral)
   *
   * Does not change the router; pass the result to set_thresholds().
   */
  [[nodiscard]] TierThresholds adjust_thresholds(double tier1_success, double tier2_success,
                                                 double adjustment_rate = 0.05) const;

  /// @throws core::ConfigException unless 0 <= tier1 <= tier2 <= 1
  void set_thresholds(TierThresholds thresholds);

  /// Share of uniformly distributed risk scores each tier receives
  [[nodiscard]] TierAttemptShares expected_distribution() const;

  [[nodiscard]] TierThresholds thresholds() const {
    return thresholds_;
  }
  [[nodiscard]] bool allow_override() const {
    return allow_override_;
  }

  /// Tier-specific mutation type for an intent, e.g. ("add_factor", Tier 2) -> "factor_add"
  [[nodiscard]] static kj::String map_intent(kj::StringPtr intent, Tier tier);

private:
  TierThresholds thresholds_;
  bool allow_override_;
};

} // namespace evoguard::mutation
