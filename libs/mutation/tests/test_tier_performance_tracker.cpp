#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/mutation/tier_performance_tracker.h"
#include "kj/test.h"

#include <cmath>

using namespace evoguard::mutation;

namespace {

void fill(TierPerformanceTracker& tracker) {
  tracker.record(1, "yaml_parameter_mutation"_kj, true, 0.05, "s1"_kj);
  tracker.record(1, "yaml_parameter_mutation"_kj, false, 0.0, "s1"_kj);
  tracker.record(2, "add_factor"_kj, true, 0.2, "s2"_kj);
  tracker.record(3, "ast_operator_mutation"_kj, false, 0.0, "s3"_kj);
}

KJ_TEST("TierPerformanceTracker: Empty tracker is well defined") {
  TierPerformanceTracker tracker;
  KJ_EXPECT(tracker.size() == 0);

  auto summary = tracker.get_tier_summary(Tier::Domain);
  KJ_EXPECT(summary.count == 0);
  KJ_EXPECT(summary.success_rate == 0.0);
  KJ_EXPECT(summary.avg_improvement == 0.0);

  auto comparison = tracker.get_tier_comparison();
  KJ_EXPECT(comparison.total_mutations == 0);
  KJ_EXPECT(comparison.best_tier_by_success_rate == 1);
  KJ_EXPECT(comparison.best_tier_by_improvement == 1);
  KJ_EXPECT(comparison.most_used_tier == 1);
  KJ_EXPECT(tracker.get_recent_trends().window_size == 0);
  KJ_EXPECT(tracker.get_mutation_type_analysis().size() == 0);
}

KJ_TEST("TierPerformanceTracker: Summary per tier") {
  TierPerformanceTracker tracker;
  fill(tracker);

  auto tier1 = tracker.get_tier_summary(Tier::Config);
  KJ_EXPECT(tier1.tier == 1);
  KJ_EXPECT(tier1.count == 2);
  KJ_EXPECT(tier1.count == tier1.successes + tier1.failures);
  KJ_EXPECT(tier1.success_rate == 0.5);
  KJ_EXPECT(tier1.avg_improvement == 0.05);

  auto types = tier1.mutation_types.find("yaml_parameter_mutation"_kj);
  KJ_EXPECT(types != kj::none);
}

KJ_TEST("TierPerformanceTracker: Comparison picks the strongest tier") {
  TierPerformanceTracker tracker;
  fill(tracker);

  auto comparison = tracker.get_tier_comparison();
  KJ_EXPECT(comparison.total_mutations == 4);
  KJ_EXPECT(comparison.distribution[0] == 2);
  KJ_EXPECT(comparison.distribution[1] == 1);
  KJ_EXPECT(comparison.distribution[2] == 1);
  KJ_EXPECT(comparison.distribution_pct[0] == 0.5);
  KJ_EXPECT(comparison.best_tier_by_success_rate == 2);
  KJ_EXPECT(comparison.best_tier_by_improvement == 2);
  KJ_EXPECT(comparison.most_used_tier == 1);
}

KJ_TEST("TierPerformanceTracker: Performance attached after evaluation") {
  TierPerformanceTracker tracker;
  auto id = tracker.record(2, "remove_factor"_kj, true, 0.0);
  tracker.attach_performance(id, 0.3);
  KJ_EXPECT(tracker.get_tier_summary(Tier::Domain).avg_improvement == 0.3);

  bool caught = false;
  try {
    tracker.attach_performance(id + 100, 1.0);
  } catch (const evoguard::core::ValidationException&) {
    caught = true;
  }
  KJ_EXPECT(caught);
}

KJ_TEST("TierPerformanceTracker: Invalid tier is rejected") {
  TierPerformanceTracker tracker;
  for (int tier : {0, 4, -1}) {
    bool caught = false;
    try {
      tracker.record(tier, "x"_kj, true, 0.0);
    } catch (const evoguard::core::ValidationException& e) {
      caught = true;
      KJ_EXPECT(e.message().contains("Invalid tier"_kj));
    }
    KJ_EXPECT(caught, tier);
  }
  KJ_EXPECT(tracker.size() == 0);
}

KJ_TEST("TierPerformanceTracker: Record queries") {
  TierPerformanceTracker tracker;
  fill(tracker);

  KJ_EXPECT(tracker.get_records().size() == 4);
  KJ_EXPECT(tracker.get_records(1).size() == 2);
  KJ_EXPECT(tracker.get_records(kj::none, true).size() == 2);
  KJ_EXPECT(tracker.get_records(1, false).size() == 1);

  auto last = tracker.get_records(kj::none, kj::none, size_t(1));
  KJ_ASSERT(last.size() == 1);
  KJ_EXPECT(last[0].tier == 3);
  KJ_EXPECT(last[0].strategy_id == "s3");

  auto trends = tracker.get_recent_trends(2);
  KJ_EXPECT(trends.window_size == 2);
  KJ_EXPECT(trends.tier_counts[0] == 0);
  KJ_EXPECT(trends.tier_counts[1] == 1);
  KJ_EXPECT(trends.tier_success_rates[1] == 1.0);
}

KJ_TEST("TierPerformanceTracker: Mutation type analysis") {
  TierPerformanceTracker tracker;
  fill(tracker);
  tracker.record(2, "yaml_parameter_mutation"_kj, true, 0.0);

  auto analysis = tracker.get_mutation_type_analysis();
  KJ_ASSERT(analysis.size() == 3);
  KJ_EXPECT(analysis[0].mutation_type == "add_factor");
  KJ_EXPECT(analysis[2].mutation_type == "yaml_parameter_mutation");
  KJ_EXPECT(analysis[2].total_count == 3);
  KJ_EXPECT(analysis[2].tier_counts[0] == 2);
  KJ_EXPECT(analysis[2].tier_counts[1] == 1);
  KJ_EXPECT(std::abs(analysis[2].success_rate - 2.0 / 3.0) < 1e-12);
}

KJ_TEST("TierPerformanceTracker: Statistics document and reset") {
  TierPerformanceTracker tracker;
  fill(tracker);

  auto doc = evoguard::core::JsonDocument::parse(tracker.get_statistics());
  auto root = doc.root();
  KJ_EXPECT(root["total_records"_kj].get_int() == 4);
  KJ_EXPECT(root["comparison"_kj]["most_used_tier"_kj].get_int() == 1);
  KJ_EXPECT(root["summary"_kj]["tier_2"_kj]["successes"_kj].get_int() == 1);
  KJ_EXPECT(root["mutation_type_analysis"_kj]["add_factor"_kj].is_object());

  tracker.reset();
  KJ_EXPECT(tracker.size() == 0);
  KJ_EXPECT(tracker.get_tier_comparison().total_mutations == 0);
}

} // namespace
