#include "evoguard/mutation/adaptive_learner.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"

#include <algorithm>
#include <cstdio>

namespace evoguard::mutation {

namespace {

kj::String percent(double rate) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f%%", rate * 100.0);
  return kj::str(buffer);
}

} // namespace

AdaptiveLearner::State::State() {
  for (int i = 0; i < 3; ++i) {
    performance[i].tier = i + 1;
  }
}

AdaptiveLearner::AdaptiveLearner(const AdaptiveLearningConfig& config) : config_(config) {
  if (config_.history_window == 0) {
    throw core::ConfigException("adaptive_learning.history_window must be positive"_kj);
  }
  if (!(config_.learning_rate > 0.0 && config_.learning_rate <= 1.0)) {
    throw core::ConfigException(
        kj::str("adaptive_learning.learning_rate must be in (0, 1], got ", config_.learning_rate));
  }
}

void AdaptiveLearner::update_tier_stats(int tier, bool success, double fitness_delta,
                                        kj::StringPtr mutation_type, kj::StringPtr strategy_id) {
  if (tier_from_number(tier) == kj::none) {
    throw core::ValidationException(kj::str("Invalid tier: ", tier, ". Must be 1, 2, or 3"));
  }

  auto lock = state_.lockExclusive();
  auto& perf = lock->performance[tier - 1];
  ++perf.attempts;
  if (success) {
    ++perf.successes;
  } else {
    ++perf.failures;
  }
  constexpr double kAlpha = 0.1;
  perf.avg_fitness_delta = kAlpha * fitness_delta + (1.0 - kAlpha) * perf.avg_fitness_delta;

  lock->history.add(HistoryEntry{tier, kj::str(mutation_type), success, fitness_delta,
                                 kj::str(strategy_id)});
  if (lock->history.size() > config_.history_window) {
    size_t drop = lock->history.size() - config_.history_window;
    kj::Vector<HistoryEntry> kept(config_.history_window);
    for (size_t i = drop; i < lock->history.size(); ++i) {
      kept.add(kj::mv(lock->history[i]));
    }
    lock->history = kj::mv(kept);
  }

  update_recent_rates(*lock, config_.history_window);
}

void AdaptiveLearner::update_recent_rates(State& state, size_t history_window) {
  if (state.history.empty()) {
    return;
  }
  size_t recent_window = std::min<size_t>(20, history_window / 3);
  for (int tier = 1; tier <= 3; ++tier) {
    kj::Vector<bool> outcomes;
    for (auto& entry : state.history) {
      if (entry.tier == tier) {
        outcomes.add(entry.success);
      }
    }
    if (outcomes.size() < 3) {
      continue;
    }
    size_t take = recent_window == 0 ? outcomes.size() : std::min(recent_window, outcomes.size());
    size_t successes = 0;
    for (size_t i = outcomes.size() - take; i < outcomes.size(); ++i) {
      successes += outcomes[i] ? 1 : 0;
    }
    state.performance[tier - 1].recent_success_rate =
        static_cast<double>(successes) / static_cast<double>(take);
  }
}

ThresholdAdjustment AdaptiveLearner::adjust_thresholds(double tier1_threshold,
                                                       double tier2_threshold) {
  auto lock = state_.lockExclusive();
  uint64_t total = 0;
  for (auto& perf : lock->performance) {
    total += perf.attempts;
  }
  if (total < config_.min_samples) {
    return ThresholdAdjustment{tier1_threshold, tier2_threshold, false, 0.0, 0.0,
                               kj::str("Insufficient samples (", total, "/",
                                       config_.min_samples, ")")};
  }

  double r1 = lock->performance[0].recent_success_rate;
  double r2 = lock->performance[1].recent_success_rate;
  double r3 = lock->performance[2].recent_success_rate;

  double new_tier1 =
      std::clamp(tier1_threshold + (r1 - 0.5) * config_.learning_rate, 0.1, 0.5);
  double new_tier2 = std::max(
      new_tier1 + 0.1, std::min(0.9, tier2_threshold + (r2 - r3) * config_.learning_rate * 0.5));

  lock->threshold_history.add(ThresholdRecord{new_tier1, new_tier2, r1, r2, r3});
  return ThresholdAdjustment{new_tier1,
                             new_tier2,
                             true,
                             new_tier1 - tier1_threshold,
                             new_tier2 - tier2_threshold,
                             kj::str("Adjusted from recent success rates")};
}

TierRecommendations AdaptiveLearner::get_tier_recommendations() const {
  auto lock = state_.lockShared();
  TierRecommendations rec;

  uint64_t total = 0;
  for (int i = 0; i < 3; ++i) {
    rec.performance[i] = lock->performance[i];
    total += lock->performance[i].attempts;
  }
  rec.total_mutations = total;

  // Trend: late half vs early half of the tier's recorded outcomes.
  for (int tier = 1; tier <= 3; ++tier) {
    kj::Vector<bool> outcomes;
    for (auto& entry : lock->history) {
      if (entry.tier == tier) {
        outcomes.add(entry.success);
      }
    }
    if (outcomes.size() < 10) {
      rec.trends[tier - 1] = "insufficient_data"_kj;
      continue;
    }
    size_t mid = outcomes.size() / 2;
    double early = 0.0;
    double late = 0.0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
      (i < mid ? early : late) += outcomes[i] ? 1.0 : 0.0;
    }
    double diff = late / static_cast<double>(outcomes.size() - mid) -
                  early / static_cast<double>(mid);
    rec.trends[tier - 1] = diff > 0.1 ? "improving"_kj : diff < -0.1 ? "declining"_kj : "stable"_kj;
  }

  // Best tier: 0.6 * recent success + 0.4 * normalized fitness, ties to the lower tier.
  double best_score = 0.0;
  rec.recommended_tier = 2;
  for (auto& perf : lock->performance) {
    if (perf.attempts < 3) {
      continue;
    }
    double fitness = std::clamp((perf.avg_fitness_delta + 0.1) / 0.2, 0.0, 1.0);
    double score = 0.6 * perf.recent_success_rate + 0.4 * fitness;
    if (score > best_score) {
      best_score = score;
      rec.recommended_tier = perf.tier;
    }
  }

  if (total == 0) {
    rec.confidence = 0.0;
  } else {
    double sample_confidence =
        std::min(static_cast<double>(total) / static_cast<double>(config_.min_samples * 3), 1.0);
    double mean = 0.0;
    for (auto& perf : lock->performance) {
      mean += perf.recent_success_rate / 3.0;
    }
    double variance = 0.0;
    for (auto& perf : lock->performance) {
      variance += (perf.recent_success_rate - mean) * (perf.recent_success_rate - mean) / 3.0;
    }
    rec.confidence = 0.6 * sample_confidence + 0.4 * (1.0 - std::min(variance * 2.0, 1.0));
  }

  for (int i = 0; i < 3; ++i) {
    auto& perf = lock->performance[i];
    if (perf.attempts < config_.min_samples / 3) {
      rec.threshold_recommendations[i] = "Need more samples"_kj;
    } else if (perf.recent_success_rate > 0.7) {
      rec.threshold_recommendations[i] = "High success - expand usage"_kj;
    } else if (perf.recent_success_rate < 0.3) {
      rec.threshold_recommendations[i] = "Low success - reduce usage"_kj;
    } else {
      rec.threshold_recommendations[i] = "Moderate performance - maintain"_kj;
    }
  }

  if (total == 0) {
    rec.insights.add(kj::str("No mutation history yet. Start evolving to gather data."));
    return rec;
  }
  const TierPerformance* best_fitness = &lock->performance[0];
  for (auto& perf : lock->performance) {
    if (perf.attempts == 0) {
      rec.insights.add(kj::str("Tier ", perf.tier, " unused - consider testing"));
    } else if (perf.recent_success_rate > 0.7) {
      rec.insights.add(kj::str("Tier ", perf.tier, " performing well (success rate: ",
                               percent(perf.recent_success_rate), ")"));
    } else if (perf.recent_success_rate < 0.3) {
      rec.insights.add(kj::str("Tier ", perf.tier, " struggling (success rate: ",
                               percent(perf.recent_success_rate), ")"));
    }
    if (perf.avg_fitness_delta > best_fitness->avg_fitness_delta) {
      best_fitness = &perf;
    }
  }
  rec.insights.add(kj::str("Tier ", best_fitness->tier, " provides best fitness improvements"));
  return rec;
}

kj::String TierRecommendations::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put("recommended_tier", recommended_tier);
  builder.put("confidence", confidence);
  builder.put("total_mutations", total_mutations);
  builder.put_object("performance_summary", [&](core::JsonBuilder& summary) {
    for (int i = 0; i < 3; ++i) {
      auto& perf = performance[i];
      summary.put_object(kj::str("tier", perf.tier), [&](core::JsonBuilder& tier) {
        tier.put("success_rate", perf.success_rate());
        tier.put("recent_success_rate", perf.recent_success_rate);
        tier.put("avg_fitness_delta", perf.avg_fitness_delta);
        tier.put("attempts", perf.attempts);
        tier.put("trend", trends[i]);
      });
    }
  });
  builder.put_object("threshold_recommendations", [&](core::JsonBuilder& recs) {
    for (int i = 0; i < 3; ++i) {
      recs.put(kj::str("tier", i + 1), threshold_recommendations[i]);
    }
  });
  builder.put_array("insights", [&](core::JsonBuilder& array) {
    for (auto& insight : insights) {
      array.add(insight.asPtr());
    }
  });
  return builder.build(pretty);
}

TierPerformance AdaptiveLearner::get_tier_performance(Tier tier) const {
  return state_.lockShared()->performance[tier_number(tier) - 1];
}

uint64_t AdaptiveLearner::total_attempts() const {
  auto lock = state_.lockShared();
  uint64_t total = 0;
  for (auto& perf : lock->performance) {
    total += perf.attempts;
  }
  return total;
}

size_t AdaptiveLearner::history_size() const {
  return state_.lockShared()->history.size();
}

size_t AdaptiveLearner::threshold_history_size() const {
  return state_.lockShared()->threshold_history.size();
}

void AdaptiveLearner::reset_stats() {
  *state_.lockExclusive() = State();
}

} // namespace evoguard::mutation
