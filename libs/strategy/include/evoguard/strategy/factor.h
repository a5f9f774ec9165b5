/**
 * @file factor.h
 * @brief Factors: the unit of structure that strategies are assembled from
 *
 * A factor is a named signal function written in the snippet language,
 * together with its numeric parameters and the factors it depends on. The
 * FactorRegistry holds the built-in factor types with their parameter bounds
 * and logic templates.
 */

#pragma once

#include "evoguard/security/validation_result.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::strategy {

/**
 * @brief Bounds for one factor parameter
 */
struct ParameterSpec {
  kj::StringPtr name; ///< Parameter name, also the keyword in the logic function
  double min;         ///< Inclusive lower bound
  double max;         ///< Inclusive upper bound
  double default_value;
  bool is_integer;

  [[nodiscard]] double clamp(double value) const;
  [[nodiscard]] bool contains(double value) const {
    return value >= min && value <= max;
  }
};

/**
 * @brief One factor instance inside a strategy
 *
 * `logic` holds the source of a single function
 * `def compute(data, name=default, ...):`; its keyword parameters are bound to
 * `parameters` when the strategy is rendered.
 */
struct Factor {
  kj::String id;                              ///< Unique within a strategy
  kj::String type;                            ///< Registry type name
  kj::String category;                        ///< "entry" or "filter"
  kj::TreeMap<kj::String, double> parameters; ///< Ordered by name
  kj::Vector<kj::String> depends_on;          ///< IDs of factors rendered before this one
  kj::String logic;                           ///< Snippet source of the signal function

  [[nodiscard]] Factor clone() const;
  [[nodiscard]] kj::Maybe<double> parameter(kj::StringPtr name) const;
  void set_parameter(kj::StringPtr name, double value);

  /// Logic parses to exactly one function whose first parameter is `data`
  [[nodiscard]] security::ValidationResult validate_logic() const;
};

struct FactorDefinition {
  kj::StringPtr type;
  kj::StringPtr category;
  kj::StringPtr description;
  kj::ArrayPtr<const ParameterSpec> parameters;
  kj::StringPtr logic_template;

  [[nodiscard]] kj::Maybe<const ParameterSpec&> find_parameter(kj::StringPtr name) const;
};

class FactorRegistry {
public:
  /// Registry preloaded with momentum, ma_cross, breakout, volatility_filter,
  /// rsi and volume_filter
  static const FactorRegistry& builtin();

  FactorRegistry() = default;
  KJ_DISALLOW_COPY_AND_MOVE(FactorRegistry);

  void register_definition(FactorDefinition definition);

  [[nodiscard]] kj::Maybe<const FactorDefinition&> find(kj::StringPtr type) const;
  [[nodiscard]] kj::Array<kj::StringPtr> types() const;
  [[nodiscard]] size_t size() const {
    return definitions_.size();
  }

  /**
   * @brief Instantiate a factor of the given type with default parameters
   * @throws kj::Exception if the type is unknown
   */
  [[nodiscard]] Factor create(kj::StringPtr type, kj::StringPtr id) const;

private:
  kj::Vector<FactorDefinition> definitions_;
};

} // namespace evoguard::strategy
