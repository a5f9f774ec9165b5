#include "evoguard/mutation/tier_router.h"

#include "evoguard/core/error.h"

#include <algorithm>
#include <cstdio>

namespace evoguard::mutation {

namespace {

struct IntentMapping {
  kj::StringPtr intent;
  kj::StringPtr tier1;
  kj::StringPtr tier2;
  kj::StringPtr tier3;
};

constexpr IntentMapping kIntentMappings[] = {
    {"add_factor"_kj, "yaml_add_factor"_kj, "factor_add"_kj, "ast_inject_factor"_kj},
    {"remove_factor"_kj, "yaml_remove_factor"_kj, "factor_remove"_kj, "ast_prune_factor"_kj},
    {"replace_factor"_kj, "yaml_replace_factor"_kj, "factor_replace"_kj, "ast_replace_logic"_kj},
    {"adjust_parameters"_kj, "yaml_adjust_parameters"_kj, "factor_mutate_parameters"_kj,
     "ast_mutate_thresholds"_kj},
    {"modify_logic"_kj, "yaml_recompose"_kj, "factor_replace"_kj, "ast_mutate_logic"_kj},
};

void check_thresholds(TierThresholds t) {
  if (!(0.0 <= t.tier1 && t.tier1 <= t.tier2 && t.tier2 <= 1.0)) {
    throw core::ConfigException(kj::str("Invalid thresholds: tier1=", t.tier1, ", tier2=", t.tier2,
                                        ". Must satisfy: 0.0 <= tier1 <= tier2 <= 1.0"));
  }
}

kj::String rationale(Tier tier, double risk_score, kj::StringPtr intent) {
  kj::StringPtr level = risk_score < 0.3 ? "low"_kj : risk_score < 0.7 ? "medium"_kj : "high"_kj;
  char score[32];
  std::snprintf(score, sizeof(score), "%.3f", risk_score);
  switch (tier) {
  case Tier::Config:
    return kj::str("Selected Tier 1 (YAML) for ", intent, ": ", level, " risk (score=", score,
                   "). Using safe configuration mutations to minimize disruption.");
  case Tier::Domain:
    return kj::str("Selected Tier 2 (Factor) for ", intent, ": ", level, " risk (score=", score,
                   "). Using domain-specific factor operations for controlled evolution.");
  case Tier::Ast:
    return kj::str("Selected Tier 3 (AST) for ", intent, ": ", level, " risk (score=", score,
                   "). Using advanced AST mutations for structural innovation.");
  }
  return kj::str("Selected Tier ", tier_number(tier), " for ", intent);
}

} // namespace

TierRouter::TierRouter(const TierRouterConfig& config)
    : thresholds_{config.tier1_threshold, config.tier2_threshold},
      allow_override_(config.allow_override) {
  check_thresholds(thresholds_);
}

void TierRouter::set_thresholds(TierThresholds thresholds) {
  check_thresholds(thresholds);
  thresholds_ = thresholds;
}

Tier TierRouter::select_tier(double risk_score, kj::Maybe<int> override_tier) const {
  KJ_IF_SOME(requested, override_tier) {
    if (!allow_override_) {
      throw core::ValidationException("Tier override is disabled"_kj);
    }
    KJ_IF_SOME(tier, tier_from_number(requested)) {
      return tier;
    }
    throw core::ValidationException(
        kj::str("Invalid tier override: ", requested, ". Must be 1, 2, or 3"));
  }

  double risk = std::clamp(risk_score, 0.0, 1.0);
  if (risk < thresholds_.tier1) {
    return Tier::Config;
  }
  if (risk < thresholds_.tier2) {
    return Tier::Domain;
  }
  return Tier::Ast;
}

kj::String TierRouter::map_intent(kj::StringPtr intent, Tier tier) {
  for (auto& mapping : kIntentMappings) {
    if (mapping.intent == intent) {
      switch (tier) {
      case Tier::Config:
        return kj::str(mapping.tier1);
      case Tier::Domain:
        return kj::str(mapping.tier2);
      case Tier::Ast:
        return kj::str(mapping.tier3);
      }
    }
  }
  return kj::str("tier", tier_number(tier), "_", intent);
}

MutationPlan TierRouter::route_mutation(kj::StringPtr intent, double risk_score,
                                        kj::Maybe<int> override_tier) const {
  auto tier = select_tier(risk_score, override_tier);
  auto text = override_tier != kj::none
                  ? kj::str("Tier ", tier_number(tier), " selected via manual override for ", intent)
                  : rationale(tier, risk_score, intent);
  return MutationPlan{tier, map_intent(intent, tier), risk_score, kj::mv(text)};
}

TierThresholds TierRouter::adjust_thresholds(double tier1_success, double tier2_success,
                                             double adjustment_rate) const {
  double tier1 = std::clamp(thresholds_.tier1 + (tier1_success - 0.5) * adjustment_rate, 0.1, 0.5);
  double tier2 = std::max(tier1 + 0.1,
                          std::min(0.9, thresholds_.tier2 + (tier2_success - 0.5) * adjustment_rate));
  return TierThresholds{tier1, tier2};
}

TierAttemptShares TierRouter::expected_distribution() const {
  return TierAttemptShares{thresholds_.tier1, thresholds_.tier2 - thresholds_.tier1,
                           1.0 - thresholds_.tier2};
}

} // namespace evoguard::mutation
