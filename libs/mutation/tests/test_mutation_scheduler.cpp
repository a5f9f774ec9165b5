#include "evoguard/core/error.h"
#include "evoguard/mutation/mutation_scheduler.h"
#include "kj/test.h"

#include <cmath>
#include <kj/debug.h>

using namespace evoguard::mutation;

namespace {

double sum(const OperatorProbabilities& probs) {
  double total = 0.0;
  for (auto& entry : probs) {
    total += entry.value;
  }
  return total;
}

double probability_of(const OperatorProbabilities& probs, kj::StringPtr name) {
  auto found = probs.find(name);
  return KJ_ASSERT_NONNULL(found, "operator missing from distribution", name);
}

KJ_TEST("MutationScheduler: Phases follow generation progress") {
  MutationScheduler scheduler{SchedulerConfig()};
  KJ_EXPECT(scheduler.phase(0) == GenerationPhase::Early);
  KJ_EXPECT(scheduler.phase(19) == GenerationPhase::Early);
  KJ_EXPECT(scheduler.phase(20) == GenerationPhase::Mid);
  KJ_EXPECT(scheduler.phase(69) == GenerationPhase::Mid);
  KJ_EXPECT(scheduler.phase(70) == GenerationPhase::Late);
  KJ_EXPECT(scheduler.phase(500) == GenerationPhase::Late);
  KJ_EXPECT(to_string(GenerationPhase::Mid) == "mid");
}

KJ_TEST("MutationScheduler: Mutation rate boosts") {
  MutationScheduler scheduler{SchedulerConfig()};
  KJ_EXPECT(scheduler.get_mutation_rate(0, 1.0) == 0.7);
  KJ_EXPECT(scheduler.get_mutation_rate(50, 1.0) == 0.4);
  KJ_EXPECT(scheduler.get_mutation_rate(90, 1.0) == 0.2);
  KJ_EXPECT(std::abs(scheduler.get_mutation_rate(90, 0.1) - 0.4) < 1e-12);
  KJ_EXPECT(std::abs(scheduler.get_mutation_rate(90, 1.0, 10) - 0.4) < 1e-12);
  KJ_EXPECT(scheduler.get_mutation_rate(0, 0.0, 50) == 1.0);
}

KJ_TEST("MutationScheduler: Distributions are normalized") {
  MutationScheduler scheduler{SchedulerConfig()};
  SuccessRates rates;
  rates.insert(kj::str("add_factor"), 0.0);
  rates.insert(kj::str("mutate_parameters"), 1.0);

  for (int generation : {0, 30, 80}) {
    auto probs = scheduler.get_operator_probabilities(generation, rates);
    KJ_EXPECT(probs.size() == 4);
    KJ_EXPECT(std::abs(sum(probs) - 1.0) < 1e-6, generation);
    for (auto& entry : probs) {
      KJ_EXPECT(entry.value > 0.0, entry.key);
    }
  }
}

KJ_TEST("MutationScheduler: Phase tables favor growth early and tuning late") {
  MutationScheduler scheduler{SchedulerConfig()};
  SuccessRates none;
  auto early = scheduler.get_operator_probabilities(0, none);
  auto late = scheduler.get_operator_probabilities(90, none);
  KJ_EXPECT(probability_of(early, "add_factor"_kj) >
            probability_of(early, "mutate_parameters"_kj));
  KJ_EXPECT(probability_of(late, "mutate_parameters"_kj) >
            probability_of(late, "add_factor"_kj));
}

KJ_TEST("MutationScheduler: Success rates shift probability") {
  MutationScheduler scheduler{SchedulerConfig()};
  SuccessRates rates;
  rates.insert(kj::str("replace_factor"), 1.0);
  rates.insert(kj::str("remove_factor"), 0.0);
  auto probs = scheduler.get_operator_probabilities(50, rates);
  KJ_EXPECT(probability_of(probs, "replace_factor"_kj) > probability_of(probs, "add_factor"_kj));
  KJ_EXPECT(probability_of(probs, "remove_factor"_kj) < probability_of(probs, "add_factor"_kj));
}

KJ_TEST("MutationScheduler: Adaptation can be disabled") {
  SchedulerConfig config;
  config.enable_adaptation = false;
  MutationScheduler scheduler(kj::mv(config));
  SuccessRates rates;
  rates.insert(kj::str("add_factor"), 1.0);
  auto probs = scheduler.get_operator_probabilities(0, rates);
  KJ_EXPECT(probability_of(probs, "add_factor"_kj) == 0.5);
}

KJ_TEST("MutationScheduler: Invalid configuration is rejected") {
  auto rejected = [](SchedulerConfig config) {
    try {
      MutationScheduler scheduler(kj::mv(config));
    } catch (const evoguard::core::ConfigException&) {
      return true;
    }
    return false;
  };

  SchedulerConfig zero_generations;
  zero_generations.max_generations = 0;
  KJ_EXPECT(rejected(kj::mv(zero_generations)));

  SchedulerConfig bad_rate;
  bad_rate.early_rate = 1.5;
  KJ_EXPECT(rejected(kj::mv(bad_rate)));

  SchedulerConfig bad_interval;
  bad_interval.update_interval = 0;
  KJ_EXPECT(rejected(kj::mv(bad_interval)));

  SchedulerConfig unbalanced;
  unbalanced.initial_probabilities[0].probability = 3.0;
  KJ_EXPECT(rejected(kj::mv(unbalanced)));

  KJ_EXPECT(!rejected(SchedulerConfig()));
}

KJ_TEST("OperatorStats: Counts and rates") {
  OperatorStats stats;
  KJ_EXPECT(stats.get_success_rate("add_factor"_kj) == 0.0);

  stats.record("add_factor"_kj, true);
  stats.record("add_factor"_kj, false);
  stats.record("add_factor"_kj, true);
  stats.record("remove_factor"_kj, false);

  auto counts = stats.counts("add_factor"_kj);
  KJ_EXPECT(counts.attempts == 3);
  KJ_EXPECT(counts.attempts == counts.successes + counts.failures);
  KJ_EXPECT(std::abs(stats.get_success_rate("add_factor"_kj) - 2.0 / 3.0) < 1e-12);

  auto rates = stats.get_all_rates();
  KJ_EXPECT(rates.size() == 2);
  stats.clear();
  KJ_EXPECT(stats.all().size() == 0);
}

} // namespace
