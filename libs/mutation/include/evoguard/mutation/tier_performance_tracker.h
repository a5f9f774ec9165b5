/**
 * @file tier_performance_tracker.h
 * @brief Append-only record of tier mutation attempts and derived statistics
 *
 * Every query is well defined with zero records: rates and improvements are
 * 0.0, and "best" or "most used" ties resolve to the lowest tier.
 */

#pragma once

#include "evoguard/mutation/mutation_types.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::mutation {

struct MutationRecord {
  int tier;
  kj::String mutation_type;
  bool success;
  double performance_delta;
  kj::String strategy_id;
  int64_t timestamp_ns;
  Metadata metadata;

  [[nodiscard]] MutationRecord clone() const;
};

struct TierStats {
  int tier = 0;
  uint64_t count = 0;
  uint64_t successes = 0;
  uint64_t failures = 0;
  double success_rate = 0.0;
  /// Mean, max and min performance delta over successful records only
  double avg_improvement = 0.0;
  double best_improvement = 0.0;
  double worst_improvement = 0.0;
  kj::TreeMap<kj::String, uint64_t> mutation_types;

  [[nodiscard]] TierStats clone() const;
};

struct TierComparison {
  uint64_t total_mutations = 0;
  uint64_t distribution[3] = {0, 0, 0};
  double distribution_pct[3] = {0.0, 0.0, 0.0};
  double success_rates[3] = {0.0, 0.0, 0.0};
  double avg_improvement[3] = {0.0, 0.0, 0.0};
  int best_tier_by_success_rate = 1;
  int best_tier_by_improvement = 1;
  int most_used_tier = 1;
};

struct MutationTypeStats {
  kj::String mutation_type;
  uint64_t tier_counts[3] = {0, 0, 0};
  uint64_t tier_successes[3] = {0, 0, 0};
  uint64_t total_count = 0;
  uint64_t total_successes = 0;
  double success_rate = 0.0;
};

struct RecentTrends {
  size_t window_size = 0;
  uint64_t tier_counts[3] = {0, 0, 0};
  double tier_success_rates[3] = {0.0, 0.0, 0.0};
};

class TierPerformanceTracker {
public:
  TierPerformanceTracker() = default;
  KJ_DISALLOW_COPY_AND_MOVE(TierPerformanceTracker);

  /**
   * @brief Append one attempt
   * @return record id, usable with attach_performance()
   * @throws core::ValidationException for a tier outside 1..3
   */
  uint64_t record(int tier, kj::StringPtr mutation_type, bool success, double performance_delta,
                  kj::StringPtr strategy_id = "unknown"_kj, Metadata metadata = {});

  /**
   * @brief Set the performance delta of an earlier record once the caller
   * has evaluated the mutated candidate
   * @throws core::ValidationException for an unknown record id
   */
  void attach_performance(uint64_t record_id, double performance_delta);

  [[nodiscard]] TierStats get_tier_summary(Tier tier) const;
  [[nodiscard]] TierComparison get_tier_comparison() const;
  /// One entry per mutation type, ordered by name
  [[nodiscard]] kj::Array<MutationTypeStats> get_mutation_type_analysis() const;

  /**
   * @brief Records filtered by tier and outcome, oldest first
   * @param limit keep only the most recent `limit` matches
   */
  [[nodiscard]] kj::Array<MutationRecord> get_records(kj::Maybe<int> tier = kj::none,
                                                      kj::Maybe<bool> success = kj::none,
                                                      kj::Maybe<size_t> limit = kj::none) const;

  [[nodiscard]] RecentTrends get_recent_trends(size_t window = 20) const;
  [[nodiscard]] size_t size() const;

  void reset();

  /// Summary, comparison and mutation type analysis as one JSON document
  [[nodiscard]] kj::String get_statistics(bool pretty = false) const;

private:
  kj::MutexGuarded<kj::Vector<MutationRecord>> records_;
};

} // namespace evoguard::mutation
