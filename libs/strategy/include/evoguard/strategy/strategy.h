/**
 * @file strategy.h
 * @brief A candidate trading strategy: factors plus an exit block
 *
 * Strategies are value objects. Mutators never modify one in place; they
 * clone, edit the clone, validate it and hand it back.
 */

#pragma once

#include "evoguard/security/validation_result.h"
#include "evoguard/strategy/factor.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::strategy {

/// Exit block used when a strategy does not carry its own
[[nodiscard]] kj::StringPtr default_exit_code();

class Strategy {
public:
  Strategy() = default;
  Strategy(kj::String id, kj::Vector<Factor> factors, kj::String exit_code);

  Strategy(Strategy&&) = default;
  Strategy& operator=(Strategy&&) = default;
  KJ_DISALLOW_COPY(Strategy);

  [[nodiscard]] Strategy clone() const;

  [[nodiscard]] kj::StringPtr id() const {
    return id_;
  }
  [[nodiscard]] kj::ArrayPtr<const Factor> factors() const {
    return factors_.asPtr();
  }
  [[nodiscard]] kj::Vector<Factor>& mutable_factors() {
    return factors_;
  }
  [[nodiscard]] kj::StringPtr exit_code() const {
    return exit_code_;
  }
  void set_exit_code(kj::String code) {
    exit_code_ = kj::mv(code);
  }
  void set_id(kj::String id) {
    id_ = kj::mv(id);
  }

  [[nodiscard]] kj::Maybe<const Factor&> find_factor(kj::StringPtr factor_id) const;
  [[nodiscard]] kj::Maybe<Factor&> find_factor(kj::StringPtr factor_id);

  /**
   * @brief Structural checks: at least one factor, unique IDs, existing and
   * acyclic dependencies, parseable logic and exit block
   */
  [[nodiscard]] security::ValidationResult validate() const;

  /**
   * @brief Render the whole strategy as one snippet
   *
   * Factor functions come first in dependency order, with their current
   * parameter values bound as keyword defaults, then a combining
   * `strategy(data, params)` function returning the position signal, then
   * the exit block.
   * @throws kj::Exception if dependencies are cyclic or logic does not parse
   */
  [[nodiscard]] kj::String to_code() const;

  /// `{strategy_id, factors:[{id, type, category, parameters, depends_on, logic}], exit_code}`
  [[nodiscard]] kj::String to_config_json(bool pretty = false) const;

  /// @throws core::ValidationException on malformed JSON or missing fields
  [[nodiscard]] static Strategy from_config_json(kj::StringPtr json);

  /// Factor indices in dependency order. @throws kj::Exception on a cycle
  [[nodiscard]] kj::Array<size_t> dependency_order() const;

private:
  kj::String id_;
  kj::Vector<Factor> factors_;
  kj::String exit_code_;
};

/**
 * @brief First dependency cycle in a factor graph, rendered as
 * "Circular dependency detected: a -> b -> a"
 *
 * Dependencies on unknown IDs are ignored here; callers report them.
 */
[[nodiscard]] kj::Maybe<kj::String>
find_dependency_cycle(kj::ArrayPtr<const kj::StringPtr> ids,
                      kj::ArrayPtr<const kj::Array<kj::StringPtr>> depends_on);

/// Python-identifier spelling of a factor ID ("ma-cross.1" -> "ma_cross_1")
[[nodiscard]] kj::String factor_function_name(kj::StringPtr factor_id);

/**
 * @brief Two-factor strategy (momentum entry plus volatility filter) used by
 * the CLI demo and tests
 */
[[nodiscard]] Strategy make_default_strategy(kj::StringPtr id = "baseline"_kj);

} // namespace evoguard::strategy
