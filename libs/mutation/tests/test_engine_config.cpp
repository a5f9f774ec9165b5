#include "evoguard/core/error.h"
#include "evoguard/mutation/engine_config.h"
#include "kj/test.h"

#include <kj/debug.h>

using namespace evoguard::mutation;

namespace {

bool rejects(kj::StringPtr json, kj::StringPtr needle = ""_kj) {
  try {
    auto config = EngineConfig::from_json(json);
  } catch (const evoguard::core::ConfigException& e) {
    KJ_EXPECT(e.message().contains(needle), e.message(), needle);
    return true;
  }
  return false;
}

KJ_TEST("EngineConfig: Defaults") {
  auto config = EngineConfig::defaults();
  config.validate();
  KJ_EXPECT(config.seed == 42);
  KJ_EXPECT(config.exit_mutation.gaussian_std_dev == 0.15);
  KJ_EXPECT(config.mutation.exit_probability == 0.2);
  KJ_EXPECT(config.mutation.tier2_probability == 0.4);
  KJ_EXPECT(config.tier_router.tier1_threshold == 0.3);
  KJ_EXPECT(config.tier_router.tier2_threshold == 0.7);
  KJ_EXPECT(config.scheduler.initial_probabilities.size() == 4);

  auto found = config.exit_mutation.find_bounds("holding_period_days"_kj);
  auto& holding = KJ_ASSERT_NONNULL(found);
  KJ_EXPECT(holding.is_integer);
  KJ_EXPECT(holding.min == 1 && holding.max == 60);
  KJ_EXPECT(config.exit_mutation.find_bounds("leverage"_kj) == kj::none);
  KJ_EXPECT(default_exit_bounds().size() == kExitParameterCount);
}

KJ_TEST("EngineConfig: Partial JSON keeps defaults") {
  auto config = EngineConfig::from_json(R"({
      "seed": 7,
      "exit_mutation": {"gaussian_std_dev": 0.3,
                        "bounds": {"stop_loss_pct": {"min": 0.02, "max": 0.15}}},
      "mutation": {"enable_fallback": false},
      "scheduler": {"max_generations": 50}
    })"_kj);
  KJ_EXPECT(config.seed == 7);
  KJ_EXPECT(config.exit_mutation.gaussian_std_dev == 0.3);
  auto found = config.exit_mutation.find_bounds("stop_loss_pct"_kj);
  auto& stop = KJ_ASSERT_NONNULL(found);
  KJ_EXPECT(stop.min == 0.02 && stop.max == 0.15);
  KJ_EXPECT(stop.default_value == 0.10);
  KJ_EXPECT(!config.mutation.enable_fallback);
  KJ_EXPECT(config.mutation.validate_mutations);
  KJ_EXPECT(config.scheduler.max_generations == 50);
  KJ_EXPECT(config.scheduler.early_rate == 0.7);
}

KJ_TEST("EngineConfig: to_json is read back unchanged") {
  auto config = EngineConfig::defaults();
  config.seed = 1234;
  config.tier_router.tier1_threshold = 0.25;
  auto restored = EngineConfig::from_json(config.to_json());
  KJ_EXPECT(restored.seed == 1234);
  KJ_EXPECT(restored.tier_router.tier1_threshold == 0.25);
  KJ_EXPECT(restored.to_json() == config.to_json());
}

KJ_TEST("EngineConfig: Invalid values are rejected") {
  KJ_EXPECT(rejects("{"_kj, "Invalid configuration JSON"_kj));
  KJ_EXPECT(rejects("[]"_kj, "must be a JSON object"_kj));
  KJ_EXPECT(rejects(R"({"seed": "x"})"_kj, "must be a number"_kj));
  KJ_EXPECT(rejects(R"({"seed": 1.5})"_kj, "must be an integer"_kj));
  KJ_EXPECT(rejects(R"({"exit_mutation": {"gaussian_std_dev": 0}})"_kj, "gaussian_std_dev"_kj));
  KJ_EXPECT(rejects(R"({"exit_mutation": {"bounds": {"leverage": {"min": 1}}}})"_kj,
                    "Unknown exit parameter"_kj));
  KJ_EXPECT(rejects(R"({"exit_mutation": {"bounds": {"stop_loss_pct": {"min": 0.3}}}})"_kj,
                    "stop_loss_pct"_kj));
  KJ_EXPECT(rejects(R"({"mutation": {"probabilities": {"tier2": 0.9}}})"_kj,
                    "must sum to 1.0"_kj));
  KJ_EXPECT(rejects(R"({"mutation": {"probabilities": {"tier1": -0.1, "tier2": 0.7}}})"_kj,
                    "must not be negative"_kj));
  KJ_EXPECT(rejects(R"({"tier_router": {"tier1_threshold": 0.8, "tier2_threshold": 0.4}})"_kj,
                    "Invalid thresholds"_kj));
  KJ_EXPECT(rejects(R"({"risk_weights": {"strategy": 0.9}})"_kj, "Weights must sum to 1.0"_kj));
  KJ_EXPECT(rejects(R"({"mutation": {"enable_fallback": 1}})"_kj, "must be a boolean"_kj));
  KJ_EXPECT(rejects(R"({"scheduler": {"initial_probabilities": {"add_factor": 0.1}}})"_kj,
                    "initial_probabilities must sum"_kj));
  KJ_EXPECT(rejects(R"({"tier3": {"threshold_scale": 0}})"_kj, "threshold_scale"_kj));
}

KJ_TEST("EngineConfig: Missing file") {
  bool caught = false;
  try {
    auto config = EngineConfig::from_file("/nonexistent/evoguard.json"_kj);
  } catch (const evoguard::core::ConfigException& e) {
    caught = true;
    KJ_EXPECT(e.message().contains("Cannot load configuration"_kj));
  }
  KJ_EXPECT(caught);
}

KJ_TEST("EngineConfig: Clone is deep") {
  auto config = EngineConfig::defaults();
  auto copy = config.clone();
  copy.scheduler.initial_probabilities[0].probability = 0.9;
  copy.exit_mutation.gaussian_std_dev = 0.5;
  KJ_EXPECT(config.scheduler.initial_probabilities[0].probability == 0.4);
  KJ_EXPECT(config.exit_mutation.gaussian_std_dev == 0.15);
}

KJ_TEST("ParameterBounds: Clamp rounds integers first") {
  ParameterBounds holding{"holding_period_days"_kj, 1, 60, true, 20};
  KJ_EXPECT(holding.clamp(14.4) == 14);
  KJ_EXPECT(holding.clamp(0.2) == 1);
  KJ_EXPECT(holding.clamp(99) == 60);

  ParameterBounds stop{"stop_loss_pct"_kj, 0.01, 0.20, false, 0.10};
  KJ_EXPECT(stop.clamp(0.123) == 0.123);
  KJ_EXPECT(stop.clamp(0.5) == 0.20);
  KJ_EXPECT(stop.contains(0.01));
  KJ_EXPECT(!stop.contains(0.0));
}

} // namespace
