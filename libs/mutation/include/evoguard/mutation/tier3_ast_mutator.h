/**
 * @file tier3_ast_mutator.h
 * @brief Tier3 mutator: syntax tree rewrites of one factor's logic
 *
 * Transforms, each applied per eligible node with probability
 * `mutation_probability` (one node is forced when the draw picks none):
 *   operator_mutation        <  <-> <=,  >  <-> >=
 *   threshold_adjustment     scale a numeric constant by 1 + U(-s, s)
 *   expression_modification  +  <-> -,   *  <-> /
 *   adaptive_parameter       rebind one keyword parameter to a value that
 *                            follows volatility or regime (one parameter)
 *
 * The rewritten function is printed back to source and must pass
 * ASTValidator, re-parse and Factor::validate_logic(); otherwise the whole
 * mutation fails and nothing is applied.
 */

#pragma once

#include "evoguard/core/logger.h"
#include "evoguard/core/random.h"
#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/mutation_types.h"
#include "evoguard/security/ast_validator.h"
#include "evoguard/snippet/ast.h"
#include "evoguard/strategy/factor.h"

#include <cstdint>
#include <kj/mutex.h>

namespace evoguard::mutation {

enum class AstTransform : uint8_t {
  OperatorMutation,
  ThresholdAdjustment,
  ExpressionModification,
  AdaptiveParameter,
};

/// "ast_operator_mutation", "ast_threshold_adjustment", "ast_expression_modification",
/// "ast_adaptive_parameter"
[[nodiscard]] kj::StringPtr mutation_type_name(AstTransform transform);

/// How an adaptive parameter follows the market
enum class AdaptiveKind : uint8_t {
  Volatility, ///< base * clamp(20-bar return vol / overall return vol, 0.5, 2)
  Regime,     ///< base * (1 + 0.2 * (bear share - bull share)), regimes 5% off a 50-bar SMA
  Bounded,    ///< base * 0.9 + 0.1 * (position of vol in its range mapped onto [min, max])
};

/// "volatility", "regime", "bounded"
[[nodiscard]] kj::StringPtr adaptive_kind_name(AdaptiveKind kind);

struct AdaptiveBounds {
  double min;
  double max;
};

class Tier3AstMutator final : public ITierMutator {
public:
  /// @throws core::ConfigException on a probability outside [0, 1] or a scale outside (0, 1)
  explicit Tier3AstMutator(const Tier3Config& config = Tier3Config(), uint64_t seed = 42,
                           core::Logger& logger = core::global_logger(),
                           const strategy::FactorRegistry& registry =
                               strategy::FactorRegistry::builtin());

  KJ_DISALLOW_COPY_AND_MOVE(Tier3AstMutator);

  [[nodiscard]] Tier tier() const override {
    return Tier::Ast;
  }
  [[nodiscard]] TierResult mutate(const strategy::Strategy& input,
                                  const MutationRequest& request) override;

  /**
   * @brief Apply one transform to every function body in `module`
   *
   * `definition` supplies parameter bounds for AdaptiveParameter.
   * @return number of nodes changed; 0 when the module has no eligible node
   */
  size_t apply_transform(snippet::Module& module, AstTransform transform, core::Random& random,
                         kj::Maybe<const strategy::FactorDefinition&> definition = kj::none) const;

  /// Nodes (or keyword parameters, for AdaptiveParameter) that `transform` can rewrite
  [[nodiscard]] static size_t count_eligible(snippet::Module& module, AstTransform transform);

  /**
   * @brief Rebind keyword parameter `param` of the first function to a market-derived value
   *
   * Statements computing the adapted value are prepended to the function body;
   * the bound parameter value is the base. Integer parameters stay integral and
   * at least 1. Without `bounds`, Bounded uses [0.5, 1.5] times the default.
   * @return false when the function has no numeric keyword parameter `param`
   *   that its body reads, or `param` is already rebound
   * @throws core::ValidationException on bounds that are empty or exclude the default
   */
  static bool make_adaptive(snippet::Module& module, kj::StringPtr param, AdaptiveKind kind,
                            kj::Maybe<AdaptiveBounds> bounds = kj::none);

private:
  Tier3Config config_;
  core::Logger& logger_;
  const strategy::FactorRegistry& registry_;
  security::ASTValidator validator_;
  kj::MutexGuarded<core::Random> random_;
};

} // namespace evoguard::mutation
