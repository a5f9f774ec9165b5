/**
 * @file risk_assessor.h
 * @brief Risk scores in [0, 1] that drive tier routing
 *
 * Three components are blended with configurable weights:
 *   strategy  structural complexity (dependency depth, factor count, logic size)
 *   market    volatility, trend flips and drawdown of the `close` column
 *   mutation  failure rate of past attempts per tier
 * A missing market series or history scores 0.5.
 */

#pragma once

#include "evoguard/mutation/engine_config.h"
#include "evoguard/snippet/data_provider.h"
#include "evoguard/strategy/strategy.h"

#include <cstdint>
#include <kj/common.h>

namespace evoguard::mutation {

struct TierAttemptCounts {
  uint64_t attempts = 0;
  uint64_t successes = 0;
};

struct RiskMetrics {
  double strategy_risk;
  double market_risk;
  double mutation_risk;
  double overall_risk;
  size_t dag_depth;
  size_t factor_count;
  bool has_market_data;
  bool has_history;
};

class RiskAssessor {
public:
  /// @throws core::ConfigException unless the weights sum to 1 within 0.01
  explicit RiskAssessor(const RiskWeights& weights = RiskWeights());

  /// Mean of min(depth/10, 1), min(factors/20, 1) and min(logic lines/300, 1)
  [[nodiscard]] double assess_strategy_risk(const strategy::Strategy& strategy) const;

  /// Mean of volatility, regime instability and drawdown scores
  [[nodiscard]] double assess_market_risk(const snippet::DataProvider& data) const;

  /// Mean over tiers of the failure rate; 0.5 for a tier never attempted
  [[nodiscard]] double assess_mutation_risk(kj::ArrayPtr<const TierAttemptCounts> history) const;

  [[nodiscard]] RiskMetrics
  assess_overall_risk(const strategy::Strategy& strategy,
                      kj::Maybe<const snippet::DataProvider&> market_data = kj::none,
                      kj::Maybe<kj::ArrayPtr<const TierAttemptCounts>> history = kj::none) const;

  [[nodiscard]] const RiskWeights& weights() const {
    return weights_;
  }

  /// Longest dependency chain, in edges
  [[nodiscard]] static size_t dependency_depth(const strategy::Strategy& strategy);
  /// Flips of the short-over-long moving-average trend; 0 below ten prices
  [[nodiscard]] static double regime_changes(kj::ArrayPtr<const double> prices);
  /// min(max drawdown / 0.2, 1)
  [[nodiscard]] static double drawdown_score(kj::ArrayPtr<const double> prices);

private:
  RiskWeights weights_;
};

} // namespace evoguard::mutation
