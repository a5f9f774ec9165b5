/**
 * @file adaptive_learner.h
 * @brief Learns tier thresholds from recorded mutation outcomes
 */

#pragma once

#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/mutation_types.h"

#include <cstdint>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::mutation {

struct TierPerformance {
  int tier = 0;
  uint64_t attempts = 0;
  uint64_t successes = 0;
  uint64_t failures = 0;
  /// Exponential moving average (alpha 0.1) of the reported fitness delta
  double avg_fitness_delta = 0.0;
  /// Success rate over the most recent attempts; 0.5 until three are recorded
  double recent_success_rate = 0.5;

  /// 0.5 when the tier was never attempted
  [[nodiscard]] double success_rate() const {
    return attempts == 0 ? 0.5 : static_cast<double>(successes) / static_cast<double>(attempts);
  }
};

struct ThresholdAdjustment {
  double tier1_threshold;
  double tier2_threshold;
  bool adjusted;
  double tier1_delta = 0.0;
  double tier2_delta = 0.0;
  kj::String reason;
};

struct TierRecommendations {
  int recommended_tier;
  double confidence;
  TierPerformance performance[3];
  /// "improving", "declining", "stable" or "insufficient_data", per tier
  kj::StringPtr trends[3];
  kj::StringPtr threshold_recommendations[3];
  kj::Vector<kj::String> insights;
  uint64_t total_mutations;

  [[nodiscard]] kj::String to_json(bool pretty = false) const;
};

class AdaptiveLearner {
public:
  explicit AdaptiveLearner(const AdaptiveLearningConfig& config = AdaptiveLearningConfig());

  KJ_DISALLOW_COPY_AND_MOVE(AdaptiveLearner);

  /// @throws core::ValidationException for a tier outside 1..3
  void update_tier_stats(int tier, bool success, double fitness_delta = 0.0,
                         kj::StringPtr mutation_type = "unknown"_kj,
                         kj::StringPtr strategy_id = ""_kj);

  /**
   * @brief Thresholds moved toward the tiers that are succeeding
   *
   *   tier1 += (r1 - 0.5) * lr            clamped to [0.1, 0.5]
   *   tier2 += (r2 - r3) * lr * 0.5       clamped to [tier1 + 0.1, 0.9]
   *
   * r is each tier's recent success rate. Below `min_samples` total
   * attempts the inputs are returned unchanged with `adjusted == false`.
   */
  [[nodiscard]] ThresholdAdjustment adjust_thresholds(double tier1_threshold,
                                                      double tier2_threshold);

  [[nodiscard]] TierRecommendations get_tier_recommendations() const;
  [[nodiscard]] TierPerformance get_tier_performance(Tier tier) const;
  [[nodiscard]] uint64_t total_attempts() const;
  [[nodiscard]] size_t history_size() const;
  [[nodiscard]] size_t threshold_history_size() const;

  void reset_stats();

  [[nodiscard]] const AdaptiveLearningConfig& config() const {
    return config_;
  }

private:
  struct HistoryEntry {
    int tier;
    kj::String mutation_type;
    bool success;
    double fitness_delta;
    kj::String strategy_id;
  };

  struct ThresholdRecord {
    double tier1_threshold;
    double tier2_threshold;
    double tier1_rate;
    double tier2_rate;
    double tier3_rate;
  };

  struct State {
    TierPerformance performance[3];
    kj::Vector<HistoryEntry> history;
    kj::Vector<ThresholdRecord> threshold_history;

    State();
  };

  static void update_recent_rates(State& state, size_t history_window);

  AdaptiveLearningConfig config_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::mutation
