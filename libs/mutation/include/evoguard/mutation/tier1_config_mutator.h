/**
 * @file tier1_config_mutator.h
 * @brief Tier1 mutator: parameter edits on the JSON configuration form
 *
 * The strategy is serialized with Strategy::to_config_json(), one numeric
 * leaf under `factors[i].parameters` is perturbed, the document is checked
 * with StrategyConfigValidator and the strategy is rebuilt from it. Factor
 * logic and structure are never touched.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/mutation_types.h"
#include "evoguard/strategy/factor.h"

#include <cstdint>
#include <kj/mutex.h>

namespace evoguard::mutation {

class Tier1ConfigMutator final : public ITierMutator {
public:
  static constexpr kj::StringPtr kMutationType = "yaml_parameter_mutation"_kj;

  explicit Tier1ConfigMutator(uint64_t seed = 42,
                              const strategy::FactorRegistry& registry =
                                  strategy::FactorRegistry::builtin(),
                              core::Logger& logger = core::global_logger(),
                              double std_dev = 0.2, bool validate = true);

  KJ_DISALLOW_COPY_AND_MOVE(Tier1ConfigMutator);

  [[nodiscard]] Tier tier() const override {
    return Tier::Config;
  }
  [[nodiscard]] TierResult mutate(const strategy::Strategy& strategy,
                                  const MutationRequest& request) override;

  /**
   * @brief Copy of `config_json` with `factors[factor_index].parameters[name]`
   * set to `value`; every other member is copied unchanged
   */
  [[nodiscard]] static kj::String replace_parameter(kj::StringPtr config_json,
                                                    size_t factor_index, kj::StringPtr name,
                                                    double value);

private:
  const strategy::FactorRegistry& registry_;
  core::Logger& logger_;
  double std_dev_;
  bool validate_;
  kj::MutexGuarded<core::Random> random_;
};

} // namespace evoguard::mutation
