/**
 * @file engine_config.h
 * @brief Configuration for the mutation engine
 *
 * One EngineConfig is built at startup (defaults, or a JSON file) and handed
 * by const reference to every mutation component, each of which copies the
 * section it needs. Every key in the JSON form is optional.
 *
 * Usage:
 *   auto config = EngineConfig::from_file("evoguard.json");
 *   UnifiedMutationOperator op(config);
 *
 * The "sandbox" section of the same file is read by sandbox::SandboxConfig.
 */

#pragma once

#include "evoguard/core/json.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::mutation {

/**
 * @brief Allowed range of one exit parameter
 */
struct ParameterBounds {
  kj::StringPtr parameter_name; ///< One of the four exit parameter names
  double min;
  double max;
  bool is_integer;
  double default_value;

  /// Clamp into [min, max]; integer parameters round to nearest first
  [[nodiscard]] double clamp(double value) const;
  [[nodiscard]] bool contains(double value) const {
    return value >= min && value <= max;
  }
};

constexpr size_t kExitParameterCount = 4;

/// stop_loss_pct, take_profit_pct, trailing_stop_offset, holding_period_days
[[nodiscard]] kj::ArrayPtr<const ParameterBounds> default_exit_bounds();

struct ExitMutationConfig {
  double gaussian_std_dev = 0.15;
  ParameterBounds bounds[kExitParameterCount];

  ExitMutationConfig();

  [[nodiscard]] kj::ArrayPtr<const ParameterBounds> all_bounds() const {
    return kj::arrayPtr(bounds, kExitParameterCount);
  }
  [[nodiscard]] kj::Maybe<const ParameterBounds&> find_bounds(kj::StringPtr name) const;
};

/**
 * @brief The single probability table deciding exit vs tier mutations and
 * the tier prior used by tier selection
 */
struct MutationConfig {
  bool enable_fallback = true;
  bool validate_mutations = true;
  double exit_probability = 0.2;
  double tier1_probability = 0.2;
  double tier2_probability = 0.4;
  double tier3_probability = 0.2;
};

struct TierRouterConfig {
  double tier1_threshold = 0.3;
  double tier2_threshold = 0.7;
  bool allow_override = true;
};

struct RiskWeights {
  double strategy = 0.4;
  double market = 0.3;
  double mutation = 0.3;
};

struct AdaptiveLearningConfig {
  size_t history_window = 100;
  double learning_rate = 0.1;
  size_t min_samples = 20;
};

struct OperatorProbability {
  kj::String name;
  double probability;
};

struct SchedulerConfig {
  int max_generations = 100;
  double early_rate = 0.7;
  double mid_rate = 0.4;
  double late_rate = 0.2;
  double diversity_threshold = 0.3;
  double diversity_boost = 0.2;
  /// add_factor 0.4, remove_factor 0.2, replace_factor 0.2, mutate_parameters 0.2
  kj::Array<OperatorProbability> initial_probabilities;
  bool enable_adaptation = true;
  double success_rate_weight = 0.3;
  double min_probability = 0.05;
  int update_interval = 5;

  SchedulerConfig();
  SchedulerConfig(SchedulerConfig&&) = default;
  SchedulerConfig& operator=(SchedulerConfig&&) = default;
  KJ_DISALLOW_COPY(SchedulerConfig);

  [[nodiscard]] SchedulerConfig clone() const;
};

struct Tier3Config {
  double mutation_probability = 0.3;
  double threshold_scale = 0.2;
};

struct EngineConfig {
  uint64_t seed = 42;
  ExitMutationConfig exit_mutation;
  MutationConfig mutation;
  TierRouterConfig tier_router;
  RiskWeights risk_weights;
  AdaptiveLearningConfig adaptive_learning;
  SchedulerConfig scheduler;
  Tier3Config tier3;

  EngineConfig() = default;
  EngineConfig(EngineConfig&&) = default;
  EngineConfig& operator=(EngineConfig&&) = default;
  KJ_DISALLOW_COPY(EngineConfig);

  [[nodiscard]] EngineConfig clone() const;

  static EngineConfig defaults() {
    return EngineConfig();
  }

  /// @throws core::ConfigException on malformed JSON or invalid values
  static EngineConfig from_json(kj::StringPtr json);
  static EngineConfig from_json(const core::JsonValue& root);
  /// @throws core::ConfigException if the file cannot be read
  static EngineConfig from_file(kj::StringPtr path);

  /// Eager checks on every section. @throws core::ConfigException
  void validate() const;

  /// Current values in the same JSON layout from_json() reads
  [[nodiscard]] kj::String to_json(bool pretty = true) const;
};

/// Scheduler-only checks, shared with MutationScheduler's constructor
void validate_scheduler_config(const SchedulerConfig& config);

} // namespace evoguard::mutation
