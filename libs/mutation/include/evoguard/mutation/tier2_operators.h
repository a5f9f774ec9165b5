/**
 * @file tier2_operators.h
 * @brief Factor-level structural operators used by the Tier2 engine
 *
 * Every operator works on a copy of its input and validates the copy before
 * returning it; an operator that cannot apply to a given strategy returns an
 * error message instead.
 */

#pragma once

#include "evoguard/core/random.h"
#include "evoguard/strategy/factor.h"
#include "evoguard/strategy/strategy.h"

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace evoguard::mutation {

/// Mutated strategy, or the reason the operator could not apply
using OperatorResult = kj::OneOf<strategy::Strategy, kj::String>;

class IMutationOperator {
public:
  virtual ~IMutationOperator() noexcept(false) = default;

  [[nodiscard]] virtual kj::StringPtr name() const = 0;
  [[nodiscard]] virtual OperatorResult apply(const strategy::Strategy& input,
                                             core::Random& random) = 0;
};

/**
 * @brief Adds a factor of a random registry type
 *
 * Entry factors are added as roots; filters depend on the current leaf
 * factors. Strategies are capped at `max_factors`.
 */
class AddFactorOperator final : public IMutationOperator {
public:
  explicit AddFactorOperator(const strategy::FactorRegistry& registry,
                             size_t max_factors = 10)
      : registry_(registry), max_factors_(max_factors) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "add_factor"_kj;
  }
  [[nodiscard]] OperatorResult apply(const strategy::Strategy& input,
                                     core::Random& random) override;

private:
  const strategy::FactorRegistry& registry_;
  size_t max_factors_;
};

/**
 * @brief Removes a factor nothing depends on; the last entry factor is kept
 */
class RemoveFactorOperator final : public IMutationOperator {
public:
  RemoveFactorOperator() = default;

  [[nodiscard]] kj::StringPtr name() const override {
    return "remove_factor"_kj;
  }
  [[nodiscard]] OperatorResult apply(const strategy::Strategy& input,
                                     core::Random& random) override;
};

/**
 * @brief Swaps a factor for a different type of the same category,
 * re-pointing dependents at the new factor
 */
class ReplaceFactorOperator final : public IMutationOperator {
public:
  explicit ReplaceFactorOperator(const strategy::FactorRegistry& registry)
      : registry_(registry) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "replace_factor"_kj;
  }
  [[nodiscard]] OperatorResult apply(const strategy::Strategy& input,
                                     core::Random& random) override;

private:
  const strategy::FactorRegistry& registry_;
};

/**
 * @brief Gaussian perturbation of one factor's parameters, clamped to the
 * registry bounds of its type
 */
class ParameterMutationOperator final : public IMutationOperator {
public:
  explicit ParameterMutationOperator(const strategy::FactorRegistry& registry,
                                     double std_dev = 0.2)
      : registry_(registry), std_dev_(std_dev) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "mutate_parameters"_kj;
  }
  [[nodiscard]] OperatorResult apply(const strategy::Strategy& input,
                                     core::Random& random) override;

private:
  const strategy::FactorRegistry& registry_;
  double std_dev_;
};

/// The four operators above, in that order
[[nodiscard]] kj::Array<kj::Own<IMutationOperator>>
make_default_operators(const strategy::FactorRegistry& registry = strategy::FactorRegistry::builtin());

/// `<type>_<n>` with the smallest n not already used in the strategy
[[nodiscard]] kj::String unique_factor_id(const strategy::Strategy& strategy, kj::StringPtr type);

} // namespace evoguard::mutation
