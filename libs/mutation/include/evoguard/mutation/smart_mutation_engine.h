/**
 * @file smart_mutation_engine.h
 * @brief Tier2 mutator: scheduler-driven choice among named factor operators
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/mutation_scheduler.h"
#include "evoguard/mutation/mutation_types.h"
#include "evoguard/mutation/tier2_operators.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/mutex.h>

namespace evoguard::mutation {

struct SmartEngineStatistics {
  kj::TreeMap<kj::String, OperatorCounts> operators;
  uint64_t total_attempts = 0;
  uint64_t total_successes = 0;

  [[nodiscard]] double success_rate() const {
    return total_attempts == 0
               ? 0.0
               : static_cast<double>(total_successes) / static_cast<double>(total_attempts);
  }
  [[nodiscard]] kj::String to_json(bool pretty = false) const;
};

class SmartMutationEngine final : public ITierMutator {
public:
  /**
   * @throws core::ConfigException if `operators` is empty, if the initial
   * distribution names an operator not in `operators`, or if the scheduler
   * configuration is invalid
   */
  SmartMutationEngine(kj::Array<kj::Own<IMutationOperator>> operators, SchedulerConfig config,
                      uint64_t seed = 42, core::Logger& logger = core::global_logger());

  /// Engine over make_default_operators(registry)
  static kj::Own<SmartMutationEngine>
  with_default_operators(const SchedulerConfig& config, uint64_t seed = 42,
                         const strategy::FactorRegistry& registry =
                             strategy::FactorRegistry::builtin(),
                         core::Logger& logger = core::global_logger());

  KJ_DISALLOW_COPY_AND_MOVE(SmartMutationEngine);

  [[nodiscard]] Tier tier() const override {
    return Tier::Domain;
  }

  /**
   * Runs `request.operator_name` when given, otherwise an operator drawn
   * from the current distribution. The outcome feeds the operator stats.
   */
  [[nodiscard]] TierResult mutate(const strategy::Strategy& strategy,
                                  const MutationRequest& request) override;

  /// Draw an operator name from the distribution for `generation`
  [[nodiscard]] kj::StringPtr select_operator(int generation);

  /**
   * @brief Distribution over this engine's operators, in operator order
   *
   * Cached; recomputed after `update_interval` generations or a phase change.
   */
  [[nodiscard]] OperatorProbabilities get_current_probabilities(int generation);

  void update_success_rate(kj::StringPtr operator_name, bool success);

  [[nodiscard]] double get_mutation_rate(int generation, double diversity,
                                         int stagnation = 0) const {
    return scheduler_.get_mutation_rate(generation, diversity, stagnation);
  }

  [[nodiscard]] SmartEngineStatistics get_statistics() const;
  void reset_statistics();

  [[nodiscard]] const MutationScheduler& scheduler() const {
    return scheduler_;
  }
  [[nodiscard]] kj::Array<kj::StringPtr> operator_names() const;

private:
  struct ProbabilityCache {
    int generation;
    GenerationPhase phase;
    kj::Array<double> weights;
  };

  struct State {
    core::Random random;
    OperatorStats stats;
    kj::Maybe<ProbabilityCache> cache;
  };

  kj::Maybe<IMutationOperator&> find_operator(kj::StringPtr name);
  kj::Array<double> compute_weights(int generation, const OperatorStats& stats) const;
  kj::ArrayPtr<const double> current_weights(State& state, int generation);
  size_t draw(State& state, int generation);

  kj::Array<kj::Own<IMutationOperator>> operators_;
  kj::Array<double> initial_weights_;
  MutationScheduler scheduler_;
  core::Logger& logger_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::mutation
