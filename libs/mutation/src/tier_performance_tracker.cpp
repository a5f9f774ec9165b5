#include "evoguard/mutation/tier_performance_tracker.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/core/time.h"

#include <algorithm>

namespace evoguard::mutation {

namespace {

TierStats summarize(kj::ArrayPtr<const MutationRecord> records, int tier) {
  TierStats stats;
  stats.tier = tier;
  double sum = 0.0;
  bool any_success = false;
  for (auto& record : records) {
    if (record.tier != tier) {
      continue;
    }
    ++stats.count;
    stats.mutation_types.upsert(kj::str(record.mutation_type), 1,
                                [](uint64_t& existing, uint64_t&&) { ++existing; });
    if (!record.success) {
      ++stats.failures;
      continue;
    }
    ++stats.successes;
    sum += record.performance_delta;
    if (!any_success) {
      stats.best_improvement = record.performance_delta;
      stats.worst_improvement = record.performance_delta;
      any_success = true;
    } else {
      stats.best_improvement = std::max(stats.best_improvement, record.performance_delta);
      stats.worst_improvement = std::min(stats.worst_improvement, record.performance_delta);
    }
  }
  if (stats.count > 0) {
    stats.success_rate = static_cast<double>(stats.successes) / static_cast<double>(stats.count);
  }
  if (stats.successes > 0) {
    stats.avg_improvement = sum / static_cast<double>(stats.successes);
  }
  return stats;
}

// Index of the first maximum, as a tier number.
template <typename T> int argmax_tier(const T (&values)[3]) {
  int best = 0;
  for (int i = 1; i < 3; ++i) {
    if (values[i] > values[best]) {
      best = i;
    }
  }
  return best + 1;
}

} // namespace

MutationRecord MutationRecord::clone() const {
  return MutationRecord{tier,
                        kj::str(mutation_type),
                        success,
                        performance_delta,
                        kj::str(strategy_id),
                        timestamp_ns,
                        clone_metadata(metadata)};
}

TierStats TierStats::clone() const {
  TierStats copy;
  copy.tier = tier;
  copy.count = count;
  copy.successes = successes;
  copy.failures = failures;
  copy.success_rate = success_rate;
  copy.avg_improvement = avg_improvement;
  copy.best_improvement = best_improvement;
  copy.worst_improvement = worst_improvement;
  for (auto& entry : mutation_types) {
    copy.mutation_types.insert(kj::str(entry.key), entry.value);
  }
  return copy;
}

uint64_t TierPerformanceTracker::record(int tier, kj::StringPtr mutation_type, bool success,
                                        double performance_delta, kj::StringPtr strategy_id,
                                        Metadata metadata) {
  if (tier_from_number(tier) == kj::none) {
    throw core::ValidationException(kj::str("Invalid tier: ", tier, ". Must be 1, 2, or 3"));
  }
  auto lock = records_.lockExclusive();
  lock->add(MutationRecord{tier, kj::str(mutation_type), success, performance_delta,
                           kj::str(strategy_id), core::now_unix_ns(), kj::mv(metadata)});
  return lock->size() - 1;
}

void TierPerformanceTracker::attach_performance(uint64_t record_id, double performance_delta) {
  auto lock = records_.lockExclusive();
  if (record_id >= lock->size()) {
    throw core::ValidationException(kj::str("Unknown mutation record: ", record_id));
  }
  (*lock)[record_id].performance_delta = performance_delta;
}

TierStats TierPerformanceTracker::get_tier_summary(Tier tier) const {
  auto lock = records_.lockShared();
  return summarize(lock->asPtr(), tier_number(tier));
}

TierComparison TierPerformanceTracker::get_tier_comparison() const {
  auto lock = records_.lockShared();
  TierComparison comparison;
  comparison.total_mutations = lock->size();
  for (int i = 0; i < 3; ++i) {
    auto stats = summarize(lock->asPtr(), i + 1);
    comparison.distribution[i] = stats.count;
    comparison.distribution_pct[i] =
        comparison.total_mutations == 0
            ? 0.0
            : static_cast<double>(stats.count) / static_cast<double>(comparison.total_mutations);
    comparison.success_rates[i] = stats.success_rate;
    comparison.avg_improvement[i] = stats.avg_improvement;
  }
  comparison.best_tier_by_success_rate = argmax_tier(comparison.success_rates);
  comparison.best_tier_by_improvement = argmax_tier(comparison.avg_improvement);
  comparison.most_used_tier = argmax_tier(comparison.distribution);
  return comparison;
}

kj::Array<MutationTypeStats> TierPerformanceTracker::get_mutation_type_analysis() const {
  auto lock = records_.lockShared();
  kj::TreeMap<kj::String, MutationTypeStats> by_type;
  for (auto& record : *lock) {
    auto& stats = by_type.findOrCreate(record.mutation_type, [&]() {
      MutationTypeStats fresh;
      fresh.mutation_type = kj::str(record.mutation_type);
      return kj::TreeMap<kj::String, MutationTypeStats>::Entry{kj::str(record.mutation_type),
                                                              kj::mv(fresh)};
    });
    ++stats.tier_counts[record.tier - 1];
    ++stats.total_count;
    if (record.success) {
      ++stats.tier_successes[record.tier - 1];
      ++stats.total_successes;
    }
  }

  auto builder = kj::heapArrayBuilder<MutationTypeStats>(by_type.size());
  for (auto& entry : by_type) {
    auto& stats = entry.value;
    stats.success_rate = stats.total_count == 0 ? 0.0
                                                : static_cast<double>(stats.total_successes) /
                                                      static_cast<double>(stats.total_count);
    builder.add(kj::mv(stats));
  }
  return builder.finish();
}

kj::Array<MutationRecord> TierPerformanceTracker::get_records(kj::Maybe<int> tier,
                                                              kj::Maybe<bool> success,
                                                              kj::Maybe<size_t> limit) const {
  auto lock = records_.lockShared();
  kj::Vector<const MutationRecord*> matches;
  for (auto& record : *lock) {
    KJ_IF_SOME(t, tier) {
      if (record.tier != t) {
        continue;
      }
    }
    KJ_IF_SOME(s, success) {
      if (record.success != s) {
        continue;
      }
    }
    matches.add(&record);
  }

  size_t begin = 0;
  KJ_IF_SOME(n, limit) {
    begin = matches.size() > n ? matches.size() - n : 0;
  }
  auto builder = kj::heapArrayBuilder<MutationRecord>(matches.size() - begin);
  for (size_t i = begin; i < matches.size(); ++i) {
    builder.add(matches[i]->clone());
  }
  return builder.finish();
}

RecentTrends TierPerformanceTracker::get_recent_trends(size_t window) const {
  auto lock = records_.lockShared();
  RecentTrends trends;
  size_t begin = lock->size() > window ? lock->size() - window : 0;
  trends.window_size = lock->size() - begin;

  uint64_t successes[3] = {0, 0, 0};
  for (size_t i = begin; i < lock->size(); ++i) {
    auto& record = (*lock)[i];
    ++trends.tier_counts[record.tier - 1];
    if (record.success) {
      ++successes[record.tier - 1];
    }
  }
  for (int i = 0; i < 3; ++i) {
    if (trends.tier_counts[i] > 0) {
      trends.tier_success_rates[i] =
          static_cast<double>(successes[i]) / static_cast<double>(trends.tier_counts[i]);
    }
  }
  return trends;
}

size_t TierPerformanceTracker::size() const {
  return records_.lockShared()->size();
}

void TierPerformanceTracker::reset() {
  records_.lockExclusive()->clear();
}

kj::String TierPerformanceTracker::get_statistics(bool pretty) const {
  auto comparison = get_tier_comparison();
  auto types = get_mutation_type_analysis();

  auto builder = core::JsonBuilder::object();
  builder.put_object("summary", [&](core::JsonBuilder& summary) {
    for (auto tier : kAllTiers) {
      auto stats = get_tier_summary(tier);
      summary.put_object(kj::str("tier_", stats.tier), [&](core::JsonBuilder& t) {
        t.put("count", stats.count);
        t.put("successes", stats.successes);
        t.put("failures", stats.failures);
        t.put("success_rate", stats.success_rate);
        t.put("avg_improvement", stats.avg_improvement);
        t.put("best_improvement", stats.best_improvement);
        t.put("worst_improvement", stats.worst_improvement);
        t.put_object("mutation_types", [&](core::JsonBuilder& m) {
          for (auto& entry : stats.mutation_types) {
            m.put(entry.key, entry.value);
          }
        });
      });
    }
  });
  builder.put_object("comparison", [&](core::JsonBuilder& c) {
    c.put("total_mutations", comparison.total_mutations);
    c.put_array("tier_distribution", [&](core::JsonBuilder& a) {
      for (auto n : comparison.distribution) {
        a.add(static_cast<int64_t>(n));
      }
    });
    c.put_array("tier_distribution_pct", [&](core::JsonBuilder& a) {
      for (auto p : comparison.distribution_pct) {
        a.add(p);
      }
    });
    c.put_array("success_rate_comparison", [&](core::JsonBuilder& a) {
      for (auto r : comparison.success_rates) {
        a.add(r);
      }
    });
    c.put_array("avg_improvement_comparison", [&](core::JsonBuilder& a) {
      for (auto r : comparison.avg_improvement) {
        a.add(r);
      }
    });
    c.put("best_tier_by_success_rate", comparison.best_tier_by_success_rate);
    c.put("best_tier_by_improvement", comparison.best_tier_by_improvement);
    c.put("most_used_tier", comparison.most_used_tier);
  });
  builder.put_object("mutation_type_analysis", [&](core::JsonBuilder& analysis) {
    for (auto& type : types) {
      analysis.put_object(type.mutation_type, [&](core::JsonBuilder& t) {
        for (int i = 0; i < 3; ++i) {
          t.put(kj::str("tier_", i + 1), type.tier_counts[i]);
          t.put(kj::str("tier_", i + 1, "_successes"), type.tier_successes[i]);
        }
        t.put("total_count", type.total_count);
        t.put("total_successes", type.total_successes);
        t.put("success_rate", type.success_rate);
      });
    }
  });
  builder.put("total_records", static_cast<uint64_t>(comparison.total_mutations));
  return builder.build(pretty);
}

} // namespace evoguard::mutation
