#pragma once

#include "evoguard/mutation/engine_config.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>

namespace evoguard::mutation {

using OperatorProbabilities = kj::TreeMap<kj::String, double>;
using SuccessRates = kj::TreeMap<kj::String, double>;

struct OperatorCounts {
  uint64_t attempts = 0;
  uint64_t successes = 0;
  uint64_t failures = 0;

  [[nodiscard]] double success_rate() const {
    return attempts == 0 ? 0.0 : static_cast<double>(successes) / static_cast<double>(attempts);
  }
};

/**
 * @brief Per-operator attempt counters. Not synchronized; owners guard it.
 */
class OperatorStats {
public:
  void record(kj::StringPtr operator_name, bool success);

  [[nodiscard]] OperatorCounts counts(kj::StringPtr operator_name) const;
  /// 0.0 when the operator was never attempted
  [[nodiscard]] double get_success_rate(kj::StringPtr operator_name) const;
  /// Rates of attempted operators only
  [[nodiscard]] SuccessRates get_all_rates() const;
  [[nodiscard]] const kj::TreeMap<kj::String, OperatorCounts>& all() const {
    return counts_;
  }
  void clear() {
    counts_.clear();
  }

private:
  kj::TreeMap<kj::String, OperatorCounts> counts_;
};

enum class GenerationPhase : uint8_t { Early, Mid, Late };

[[nodiscard]] kj::StringPtr to_string(GenerationPhase phase);

/**
 * @brief Generation-aware mutation rate and Tier2 operator distribution
 *
 * Phase is `generation / max_generations`: below 0.2 early, below 0.7 mid,
 * late otherwise. Early runs favor add_factor, late runs mutate_parameters.
 */
class MutationScheduler {
public:
  /// @throws core::ConfigException
  explicit MutationScheduler(SchedulerConfig config);

  [[nodiscard]] GenerationPhase phase(int generation) const;

  /**
   * @brief Base rate of the phase, plus diversity_boost below the diversity
   * threshold, plus 0.1 per five stagnant generations, clipped to [0, 1]
   */
  [[nodiscard]] double get_mutation_rate(int generation, double diversity,
                                         int stagnation_count = 0) const;

  /**
   * @brief Phase table adjusted by `weight * (rate - 0.5)` per operator,
   * floored at min_probability and normalized to sum to 1
   *
   * Operators missing from `success_rates` count as 0.5. With adaptation
   * disabled the phase table is returned unchanged.
   */
  [[nodiscard]] OperatorProbabilities get_operator_probabilities(
      int generation, const SuccessRates& success_rates) const;

  /// Unadjusted table for a phase
  [[nodiscard]] static OperatorProbabilities base_probabilities(GenerationPhase phase);

  [[nodiscard]] const SchedulerConfig& config() const {
    return config_;
  }

private:
  SchedulerConfig config_;
};

} // namespace evoguard::mutation
