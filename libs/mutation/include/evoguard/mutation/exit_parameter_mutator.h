/**
 * @file exit_parameter_mutator.h
 * @brief Bounded Gaussian mutation of the four exit parameters
 *
 * Exit parameters are plain numeric assignments (`stop_loss_pct = 0.10`).
 * The mutator edits the first assignment of one parameter in place with a
 * pattern match instead of a tree rewrite, so comments and formatting of the
 * rest of the snippet are preserved byte for byte.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/engine_config.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/string.h>

namespace evoguard::mutation {

struct ExitMutationMetadata {
  kj::String parameter_name;
  double old_value = 0.0;
  double new_value = 0.0;
  bool clamped = false;
};

/**
 * @brief Outcome of one exit mutation
 *
 * When `success` is false, `mutated_code` is identical to the input.
 */
struct ExitMutationResult {
  kj::String mutated_code;
  bool success = false;
  ExitMutationMetadata metadata;
  kj::Maybe<kj::String> error;
  bool validation_passed = false;
};

struct ExitMutationStatistics {
  uint64_t total = 0;
  uint64_t success = 0;
  uint64_t failed_regex = 0;
  uint64_t failed_validation = 0;
  uint64_t clamped = 0;

  [[nodiscard]] double success_rate() const {
    return total == 0 ? 0.0 : static_cast<double>(success) / static_cast<double>(total);
  }
};

class ExitParameterMutator {
public:
  /// @throws core::ConfigException on invalid bounds or a non-positive std dev
  explicit ExitParameterMutator(const ExitMutationConfig& config = ExitMutationConfig(),
                                uint64_t seed = 42,
                                core::Logger& logger = core::global_logger());

  KJ_DISALLOW_COPY_AND_MOVE(ExitParameterMutator);

  /**
   * @brief Mutate one exit parameter of a snippet
   *
   * Steps: select the parameter (uniformly when none is given), find its
   * first `name = <number>` assignment, perturb with
   * `old * (1 + N(0, sigma))`, take the absolute value, clamp to bounds,
   * write the value back at the same site and re-check syntax.
   */
  [[nodiscard]] ExitMutationResult mutate(kj::StringPtr code,
                                          kj::Maybe<kj::StringPtr> parameter_name = kj::none);

  [[nodiscard]] ExitMutationStatistics get_statistics() const;
  void reset_statistics();

  [[nodiscard]] const ExitMutationConfig& config() const {
    return config_;
  }

  /// First assignment value of `parameter_name` in `code`, if any
  [[nodiscard]] static kj::Maybe<double> find_value(kj::StringPtr code,
                                                    kj::StringPtr parameter_name);

  /// "0.123457" for floats, "15" for integer parameters
  [[nodiscard]] static kj::String format_value(double value, bool is_integer);

private:
  struct State {
    core::Random random;
    ExitMutationStatistics stats;
  };

  ExitMutationResult fail(kj::StringPtr code, ExitMutationMetadata metadata, kj::String error);

  ExitMutationConfig config_;
  core::Logger& logger_;
  kj::MutexGuarded<State> state_;
};

} // namespace evoguard::mutation
