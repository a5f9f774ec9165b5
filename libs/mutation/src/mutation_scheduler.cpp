#include "evoguard/mutation/mutation_scheduler.h"

#include <algorithm>
#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

struct PhaseEntry {
  kj::StringPtr name;
  double probability;
};

constexpr PhaseEntry kEarly[] = {{"add_factor"_kj, 0.5},
                                 {"remove_factor"_kj, 0.2},
                                 {"replace_factor"_kj, 0.2},
                                 {"mutate_parameters"_kj, 0.1}};
constexpr PhaseEntry kMid[] = {{"add_factor"_kj, 0.25},
                               {"remove_factor"_kj, 0.25},
                               {"replace_factor"_kj, 0.25},
                               {"mutate_parameters"_kj, 0.25}};
constexpr PhaseEntry kLate[] = {{"add_factor"_kj, 0.15},
                                {"remove_factor"_kj, 0.15},
                                {"replace_factor"_kj, 0.2},
                                {"mutate_parameters"_kj, 0.5}};

} // namespace

void OperatorStats::record(kj::StringPtr operator_name, bool success) {
  auto& counts = counts_.findOrCreate(operator_name, [&]() {
    return kj::TreeMap<kj::String, OperatorCounts>::Entry{kj::str(operator_name), {}};
  });
  ++counts.attempts;
  if (success) {
    ++counts.successes;
  } else {
    ++counts.failures;
  }
}

OperatorCounts OperatorStats::counts(kj::StringPtr operator_name) const {
  KJ_IF_SOME(found, counts_.find(operator_name)) {
    return found;
  }
  return OperatorCounts();
}

double OperatorStats::get_success_rate(kj::StringPtr operator_name) const {
  return counts(operator_name).success_rate();
}

SuccessRates OperatorStats::get_all_rates() const {
  SuccessRates rates;
  for (auto& entry : counts_) {
    rates.insert(kj::str(entry.key), entry.value.success_rate());
  }
  return rates;
}

kj::StringPtr to_string(GenerationPhase phase) {
  switch (phase) {
  case GenerationPhase::Early:
    return "early"_kj;
  case GenerationPhase::Mid:
    return "mid"_kj;
  case GenerationPhase::Late:
    return "late"_kj;
  }
  KJ_UNREACHABLE;
}

MutationScheduler::MutationScheduler(SchedulerConfig config) : config_(kj::mv(config)) {
  validate_scheduler_config(config_);
}

GenerationPhase MutationScheduler::phase(int generation) const {
  double progress = static_cast<double>(generation) / static_cast<double>(config_.max_generations);
  if (progress < 0.2) {
    return GenerationPhase::Early;
  }
  if (progress < 0.7) {
    return GenerationPhase::Mid;
  }
  return GenerationPhase::Late;
}

double MutationScheduler::get_mutation_rate(int generation, double diversity,
                                            int stagnation_count) const {
  double rate = 0.0;
  switch (phase(generation)) {
  case GenerationPhase::Early:
    rate = config_.early_rate;
    break;
  case GenerationPhase::Mid:
    rate = config_.mid_rate;
    break;
  case GenerationPhase::Late:
    rate = config_.late_rate;
    break;
  }
  if (diversity < config_.diversity_threshold) {
    rate += config_.diversity_boost;
  }
  rate += static_cast<double>(std::max(stagnation_count, 0) / 5) * 0.1;
  return std::clamp(rate, 0.0, 1.0);
}

OperatorProbabilities MutationScheduler::base_probabilities(GenerationPhase phase) {
  kj::ArrayPtr<const PhaseEntry> table;
  switch (phase) {
  case GenerationPhase::Early:
    table = kj::arrayPtr(kEarly, 4);
    break;
  case GenerationPhase::Mid:
    table = kj::arrayPtr(kMid, 4);
    break;
  case GenerationPhase::Late:
    table = kj::arrayPtr(kLate, 4);
    break;
  }
  OperatorProbabilities probs;
  for (auto& entry : table) {
    probs.insert(kj::str(entry.name), entry.probability);
  }
  return probs;
}

OperatorProbabilities
MutationScheduler::get_operator_probabilities(int generation,
                                              const SuccessRates& success_rates) const {
  auto probs = base_probabilities(phase(generation));
  if (!config_.enable_adaptation) {
    return probs;
  }

  double total = 0.0;
  for (auto& entry : probs) {
    double rate = 0.5;
    KJ_IF_SOME(r, success_rates.find(entry.key)) {
      rate = r;
    }
    entry.value = std::max(entry.value + config_.success_rate_weight * (rate - 0.5),
                           config_.min_probability);
    total += entry.value;
  }
  if (total > 0.0) {
    for (auto& entry : probs) {
      entry.value /= total;
    }
  }
  return probs;
}

} // namespace evoguard::mutation
