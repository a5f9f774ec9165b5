/**
 * @file mutation_types.h
 * @brief Value types shared by the mutators, the tier selection manager and
 * the unified operator
 */

#pragma once

#include "evoguard/snippet/data_provider.h"
#include "evoguard/strategy/strategy.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace evoguard::mutation {

/**
 * @brief Mutation tiers, in increasing structural risk
 */
enum class Tier : uint8_t {
  Config = 1, ///< Parameter edits on the JSON configuration form
  Domain = 2, ///< Factor-level operators (add/remove/replace/mutate)
  Ast = 3,    ///< Syntax tree rewrites of factor logic
};

constexpr Tier kAllTiers[] = {Tier::Config, Tier::Domain, Tier::Ast};

[[nodiscard]] constexpr int tier_number(Tier tier) {
  return static_cast<int>(tier);
}
[[nodiscard]] kj::Maybe<Tier> tier_from_number(int number);
/// "Tier 1 (Config)"
[[nodiscard]] kj::StringPtr to_string(Tier tier);

/// Ordered string map used for free-form result metadata
using Metadata = kj::TreeMap<kj::String, kj::String>;

void set_metadata(Metadata& metadata, kj::StringPtr key, kj::String value);
[[nodiscard]] Metadata clone_metadata(const Metadata& metadata);

/**
 * @brief Per-call mutation context supplied by the evolution loop
 *
 * String fields are borrowed; they must outlive the mutate() call.
 */
struct MutationRequest {
  int generation = 0;
  double diversity = 1.0;
  int stagnation = 0;
  /// add_factor, remove_factor, replace_factor, adjust_parameters, modify_logic, ...
  kj::StringPtr intent = "generic"_kj;
  /// "exit_parameter_mutation" forces the exit path; any other value forces the tier path
  kj::Maybe<kj::StringPtr> mutation_type;
  kj::Maybe<int> override_tier;
  kj::Maybe<kj::StringPtr> exit_parameter;
  /// Tier2 operator to run instead of the scheduler's choice
  kj::Maybe<kj::StringPtr> operator_name;
  kj::Maybe<const snippet::DataProvider&> market_data;
};

struct TierSuccess {
  strategy::Strategy strategy;
  kj::String mutation_type;
  Metadata metadata;
};

struct TierFailure {
  kj::String error;
  kj::String mutation_type;
};

using TierResult = kj::OneOf<TierSuccess, TierFailure>;

/**
 * @brief One mutation tier. Implementations never modify their input and
 * report every expected failure as a TierFailure.
 */
class ITierMutator {
public:
  virtual ~ITierMutator() noexcept(false) = default;

  [[nodiscard]] virtual Tier tier() const = 0;
  [[nodiscard]] virtual TierResult mutate(const strategy::Strategy& strategy,
                                          const MutationRequest& request) = 0;
};

struct MutationPlan {
  Tier tier;
  kj::String mutation_type;
  double risk_score;
  kj::String rationale;

  [[nodiscard]] MutationPlan clone() const {
    return MutationPlan{tier, kj::str(mutation_type), risk_score, kj::str(rationale)};
  }
};

/**
 * @brief Result of UnifiedMutationOperator::mutate
 *
 * On failure `strategy` is an unchanged copy of the input.
 */
struct MutationOutcome {
  bool success = false;
  strategy::Strategy strategy;
  int tier_used = 0; ///< 0 for exit parameter mutations
  kj::String mutation_type;
  kj::Vector<int> fallback_chain;
  kj::Maybe<kj::String> error;
  Metadata metadata;
  /// Tracker record of a tier outcome; none for exit mutations and rejected requests
  kj::Maybe<uint64_t> record_id;
};

/// "[3, 2, 1]"
[[nodiscard]] kj::String format_chain(kj::ArrayPtr<const int> chain);

} // namespace evoguard::mutation
