#include "evoguard/mutation/engine_config.h"

#include "evoguard/core/error.h"
#include "evoguard/core/logger.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

constexpr ParameterBounds kDefaultExitBounds[kExitParameterCount] = {
    {"stop_loss_pct"_kj, 0.01, 0.20, false, 0.10},
    {"take_profit_pct"_kj, 0.05, 0.50, false, 0.20},
    {"trailing_stop_offset"_kj, 0.005, 0.05, false, 0.02},
    {"holding_period_days"_kj, 1, 60, true, 20},
};

[[noreturn]] void config_error(kj::String message) {
  throw core::ConfigException(message);
}

double read_number(const core::JsonValue& section, kj::StringPtr key, double current) {
  auto value = section[key];
  if (!value.is_valid() || value.is_null()) {
    return current;
  }
  if (!value.is_number()) {
    config_error(kj::str("Configuration key '", key, "' must be a number"));
  }
  return value.get_double();
}

int64_t read_integer(const core::JsonValue& section, kj::StringPtr key, int64_t current) {
  double value = read_number(section, key, static_cast<double>(current));
  if (std::floor(value) != value) {
    config_error(kj::str("Configuration key '", key, "' must be an integer"));
  }
  return static_cast<int64_t>(value);
}

bool read_bool(const core::JsonValue& section, kj::StringPtr key, bool current) {
  auto value = section[key];
  if (!value.is_valid() || value.is_null()) {
    return current;
  }
  if (!value.is_bool()) {
    config_error(kj::str("Configuration key '", key, "' must be a boolean"));
  }
  return value.get_bool();
}

bool in_unit_interval(double v) {
  return v >= 0.0 && v <= 1.0;
}

void read_exit_section(const core::JsonValue& section, ExitMutationConfig& out) {
  out.gaussian_std_dev = read_number(section, "gaussian_std_dev"_kj, out.gaussian_std_dev);
  auto bounds = section["bounds"_kj];
  if (!bounds.is_valid()) {
    return;
  }
  if (!bounds.is_object()) {
    config_error(kj::str("exit_mutation.bounds must be an object"));
  }
  bounds.for_each_object([&](kj::StringPtr name, const core::JsonValue& entry) {
    ParameterBounds* target = nullptr;
    for (auto& b : out.bounds) {
      if (b.parameter_name == name) {
        target = &b;
      }
    }
    if (target == nullptr) {
      config_error(kj::str("Unknown exit parameter in bounds: ", name));
    }
    target->min = read_number(entry, "min"_kj, target->min);
    target->max = read_number(entry, "max"_kj, target->max);
    target->default_value = read_number(entry, "default"_kj, target->default_value);
  });
}

void read_scheduler_section(const core::JsonValue& section, SchedulerConfig& out) {
  out.max_generations =
      static_cast<int>(read_integer(section, "max_generations"_kj, out.max_generations));
  out.early_rate = read_number(section, "early_rate"_kj, out.early_rate);
  out.mid_rate = read_number(section, "mid_rate"_kj, out.mid_rate);
  out.late_rate = read_number(section, "late_rate"_kj, out.late_rate);
  out.diversity_threshold = read_number(section, "diversity_threshold"_kj, out.diversity_threshold);
  out.diversity_boost = read_number(section, "diversity_boost"_kj, out.diversity_boost);
  out.enable_adaptation = read_bool(section, "enable_adaptation"_kj, out.enable_adaptation);
  out.success_rate_weight = read_number(section, "success_rate_weight"_kj, out.success_rate_weight);
  out.min_probability = read_number(section, "min_probability"_kj, out.min_probability);
  out.update_interval =
      static_cast<int>(read_integer(section, "update_interval"_kj, out.update_interval));

  // A provided table replaces the default one entirely
  auto probs = section["initial_probabilities"_kj];
  if (probs.is_valid()) {
    if (!probs.is_object()) {
      config_error(kj::str("scheduler.initial_probabilities must be an object"));
    }
    kj::Vector<OperatorProbability> entries;
    probs.for_each_object([&](kj::StringPtr name, const core::JsonValue& value) {
      if (!value.is_number()) {
        config_error(kj::str("Probability for operator '", name, "' must be a number"));
      }
      entries.add(OperatorProbability{kj::str(name), value.get_double()});
    });
    out.initial_probabilities = entries.releaseAsArray();
  }
}

} // namespace

double ParameterBounds::clamp(double value) const {
  double v = is_integer ? std::round(value) : value;
  if (v < min) {
    v = min;
  } else if (v > max) {
    v = max;
  }
  return v;
}

kj::ArrayPtr<const ParameterBounds> default_exit_bounds() {
  return kj::arrayPtr(kDefaultExitBounds, kExitParameterCount);
}

ExitMutationConfig::ExitMutationConfig() {
  for (size_t i = 0; i < kExitParameterCount; ++i) {
    bounds[i] = kDefaultExitBounds[i];
  }
}

kj::Maybe<const ParameterBounds&> ExitMutationConfig::find_bounds(kj::StringPtr name) const {
  for (auto& b : bounds) {
    if (b.parameter_name == name) {
      return b;
    }
  }
  return kj::none;
}

SchedulerConfig::SchedulerConfig() {
  auto builder = kj::heapArrayBuilder<OperatorProbability>(4);
  builder.add(OperatorProbability{kj::str("add_factor"), 0.4});
  builder.add(OperatorProbability{kj::str("remove_factor"), 0.2});
  builder.add(OperatorProbability{kj::str("replace_factor"), 0.2});
  builder.add(OperatorProbability{kj::str("mutate_parameters"), 0.2});
  initial_probabilities = builder.finish();
}

SchedulerConfig SchedulerConfig::clone() const {
  SchedulerConfig copy;
  copy.max_generations = max_generations;
  copy.early_rate = early_rate;
  copy.mid_rate = mid_rate;
  copy.late_rate = late_rate;
  copy.diversity_threshold = diversity_threshold;
  copy.diversity_boost = diversity_boost;
  copy.initial_probabilities = KJ_MAP(entry, initial_probabilities) {
    return OperatorProbability{kj::str(entry.name), entry.probability};
  };
  copy.enable_adaptation = enable_adaptation;
  copy.success_rate_weight = success_rate_weight;
  copy.min_probability = min_probability;
  copy.update_interval = update_interval;
  return copy;
}

EngineConfig EngineConfig::clone() const {
  EngineConfig copy;
  copy.seed = seed;
  copy.exit_mutation = exit_mutation;
  copy.mutation = mutation;
  copy.tier_router = tier_router;
  copy.risk_weights = risk_weights;
  copy.adaptive_learning = adaptive_learning;
  copy.scheduler = scheduler.clone();
  copy.tier3 = tier3;
  return copy;
}

EngineConfig EngineConfig::from_json(kj::StringPtr json) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse(json); })) {
    config_error(kj::str("Invalid configuration JSON: ", exception.getDescription()));
  }
  return from_json(doc.root());
}

EngineConfig EngineConfig::from_json(const core::JsonValue& root) {
  if (!root.is_object()) {
    config_error(kj::str("Configuration root must be a JSON object"));
  }

  EngineConfig config;
  config.seed = static_cast<uint64_t>(read_integer(root, "seed"_kj, 42));

  read_exit_section(root["exit_mutation"_kj], config.exit_mutation);

  auto mutation = root["mutation"_kj];
  config.mutation.enable_fallback =
      read_bool(mutation, "enable_fallback"_kj, config.mutation.enable_fallback);
  config.mutation.validate_mutations =
      read_bool(mutation, "validate_mutations"_kj, config.mutation.validate_mutations);
  auto probs = mutation["probabilities"_kj];
  config.mutation.exit_probability =
      read_number(probs, "exit_parameter_mutation"_kj, config.mutation.exit_probability);
  config.mutation.tier1_probability =
      read_number(probs, "tier1"_kj, config.mutation.tier1_probability);
  config.mutation.tier2_probability =
      read_number(probs, "tier2"_kj, config.mutation.tier2_probability);
  config.mutation.tier3_probability =
      read_number(probs, "tier3"_kj, config.mutation.tier3_probability);

  auto router = root["tier_router"_kj];
  config.tier_router.tier1_threshold =
      read_number(router, "tier1_threshold"_kj, config.tier_router.tier1_threshold);
  config.tier_router.tier2_threshold =
      read_number(router, "tier2_threshold"_kj, config.tier_router.tier2_threshold);
  config.tier_router.allow_override =
      read_bool(router, "allow_override"_kj, config.tier_router.allow_override);

  auto weights = root["risk_weights"_kj];
  config.risk_weights.strategy = read_number(weights, "strategy"_kj, config.risk_weights.strategy);
  config.risk_weights.market = read_number(weights, "market"_kj, config.risk_weights.market);
  config.risk_weights.mutation = read_number(weights, "mutation"_kj, config.risk_weights.mutation);

  auto learning = root["adaptive_learning"_kj];
  auto window = read_integer(learning, "history_window"_kj,
                             static_cast<int64_t>(config.adaptive_learning.history_window));
  auto min_samples = read_integer(learning, "min_samples"_kj,
                                  static_cast<int64_t>(config.adaptive_learning.min_samples));
  if (window <= 0 || min_samples < 0) {
    config_error(kj::str("adaptive_learning.history_window must be positive and min_samples "
                         "non-negative"));
  }
  config.adaptive_learning.history_window = static_cast<size_t>(window);
  config.adaptive_learning.min_samples = static_cast<size_t>(min_samples);
  config.adaptive_learning.learning_rate =
      read_number(learning, "learning_rate"_kj, config.adaptive_learning.learning_rate);

  read_scheduler_section(root["scheduler"_kj], config.scheduler);

  auto tier3 = root["tier3"_kj];
  config.tier3.mutation_probability =
      read_number(tier3, "mutation_probability"_kj, config.tier3.mutation_probability);
  config.tier3.threshold_scale =
      read_number(tier3, "threshold_scale"_kj, config.tier3.threshold_scale);

  config.validate();
  return config;
}

EngineConfig EngineConfig::from_file(kj::StringPtr path) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception,
             kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse_file(path); })) {
    config_error(kj::str("Cannot load configuration ", path, ": ", exception.getDescription()));
  }
  auto config = from_json(doc.root());
  core::global_logger().info(kj::str("Loaded engine configuration from ", path));
  return config;
}

void EngineConfig::validate() const {
  if (!(exit_mutation.gaussian_std_dev > 0.0)) {
    config_error(kj::str("exit_mutation.gaussian_std_dev must be positive, got ",
                         exit_mutation.gaussian_std_dev));
  }
  for (auto& b : exit_mutation.bounds) {
    if (!(b.min < b.max)) {
      config_error(kj::str("Invalid bounds for ", b.parameter_name, ": min ", b.min,
                           " must be less than max ", b.max));
    }
    if (!b.contains(b.default_value)) {
      config_error(kj::str("Default ", b.default_value, " for ", b.parameter_name,
                           " is outside [", b.min, ", ", b.max, "]"));
    }
  }

  double table[] = {mutation.exit_probability, mutation.tier1_probability,
                    mutation.tier2_probability, mutation.tier3_probability};
  double total = 0.0;
  for (double p : table) {
    if (p < 0.0) {
      config_error(kj::str("mutation.probabilities must not be negative, got ", p));
    }
    total += p;
  }
  if (std::fabs(total - 1.0) > 0.05) {
    config_error(kj::str("mutation.probabilities must sum to 1.0 (+/- 0.05), got ", total));
  }
  if (mutation.tier1_probability + mutation.tier2_probability + mutation.tier3_probability <=
      0.0) {
    config_error(kj::str("mutation.probabilities must give at least one tier a weight"));
  }

  if (!(0.0 <= tier_router.tier1_threshold &&
        tier_router.tier1_threshold <= tier_router.tier2_threshold &&
        tier_router.tier2_threshold <= 1.0)) {
    config_error(kj::str("Invalid thresholds: tier1=", tier_router.tier1_threshold,
                         ", tier2=", tier_router.tier2_threshold,
                         ". Must satisfy: 0.0 <= tier1 <= tier2 <= 1.0"));
  }

  double weight_sum = risk_weights.strategy + risk_weights.market + risk_weights.mutation;
  if (std::fabs(weight_sum - 1.0) > 0.01) {
    config_error(kj::str("Weights must sum to 1.0, got ", weight_sum));
  }

  if (!(adaptive_learning.learning_rate > 0.0 && adaptive_learning.learning_rate <= 1.0)) {
    config_error(kj::str("adaptive_learning.learning_rate must be in (0, 1], got ",
                         adaptive_learning.learning_rate));
  }

  validate_scheduler_config(scheduler);

  if (!in_unit_interval(tier3.mutation_probability)) {
    config_error(kj::str("tier3.mutation_probability must be in [0, 1], got ",
                         tier3.mutation_probability));
  }
  if (!(tier3.threshold_scale > 0.0 && tier3.threshold_scale < 1.0)) {
    config_error(
        kj::str("tier3.threshold_scale must be in (0, 1), got ", tier3.threshold_scale));
  }
}

void validate_scheduler_config(const SchedulerConfig& config) {
  if (config.max_generations <= 0) {
    config_error(kj::str("max_generations must be positive, got ", config.max_generations));
  }
  struct NamedRate {
    kj::StringPtr name;
    double value;
  };
  NamedRate rates[] = {{"early_rate"_kj, config.early_rate},
                       {"mid_rate"_kj, config.mid_rate},
                       {"late_rate"_kj, config.late_rate},
                       {"diversity_boost"_kj, config.diversity_boost},
                       {"diversity_threshold"_kj, config.diversity_threshold}};
  for (auto& rate : rates) {
    if (!in_unit_interval(rate.value)) {
      config_error(kj::str(rate.name, " must be in [0, 1], got ", rate.value));
    }
  }
  if (config.initial_probabilities.size() == 0) {
    config_error(kj::str("initial_probabilities must name at least one operator"));
  }
  double total = 0.0;
  for (auto& entry : config.initial_probabilities) {
    if (entry.probability < 0.0) {
      config_error(kj::str("Probability for operator '", entry.name, "' must not be negative"));
    }
    total += entry.probability;
  }
  if (total < 0.95 || total > 1.05) {
    config_error(kj::str("initial_probabilities must sum to ~1.0, got ", total));
  }
  if (!in_unit_interval(config.min_probability)) {
    config_error(kj::str("min_probability must be in [0, 1], got ", config.min_probability));
  }
  if (config.success_rate_weight < 0.0) {
    config_error(kj::str("success_rate_weight must not be negative, got ",
                         config.success_rate_weight));
  }
  if (config.update_interval <= 0) {
    config_error(kj::str("update_interval must be positive, got ", config.update_interval));
  }
}

kj::String EngineConfig::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put("seed"_kj, seed);
  builder.put_object("exit_mutation"_kj, [&](core::JsonBuilder& exit) {
    exit.put("gaussian_std_dev"_kj, exit_mutation.gaussian_std_dev);
    exit.put_object("bounds"_kj, [&](core::JsonBuilder& bounds) {
      for (auto& b : exit_mutation.bounds) {
        bounds.put_object(b.parameter_name, [&](core::JsonBuilder& entry) {
          entry.put("min"_kj, b.min).put("max"_kj, b.max).put("default"_kj, b.default_value);
        });
      }
    });
  });
  builder.put_object("mutation"_kj, [&](core::JsonBuilder& m) {
    m.put("enable_fallback"_kj, mutation.enable_fallback);
    m.put("validate_mutations"_kj, mutation.validate_mutations);
    m.put_object("probabilities"_kj, [&](core::JsonBuilder& p) {
      p.put("exit_parameter_mutation"_kj, mutation.exit_probability);
      p.put("tier1"_kj, mutation.tier1_probability);
      p.put("tier2"_kj, mutation.tier2_probability);
      p.put("tier3"_kj, mutation.tier3_probability);
    });
  });
  builder.put_object("tier_router"_kj, [&](core::JsonBuilder& r) {
    r.put("tier1_threshold"_kj, tier_router.tier1_threshold);
    r.put("tier2_threshold"_kj, tier_router.tier2_threshold);
    r.put("allow_override"_kj, tier_router.allow_override);
  });
  builder.put_object("risk_weights"_kj, [&](core::JsonBuilder& w) {
    w.put("strategy"_kj, risk_weights.strategy);
    w.put("market"_kj, risk_weights.market);
    w.put("mutation"_kj, risk_weights.mutation);
  });
  builder.put_object("adaptive_learning"_kj, [&](core::JsonBuilder& a) {
    a.put("history_window"_kj, static_cast<uint64_t>(adaptive_learning.history_window));
    a.put("learning_rate"_kj, adaptive_learning.learning_rate);
    a.put("min_samples"_kj, static_cast<uint64_t>(adaptive_learning.min_samples));
  });
  builder.put_object("scheduler"_kj, [&](core::JsonBuilder& s) {
    s.put("max_generations"_kj, scheduler.max_generations);
    s.put("early_rate"_kj, scheduler.early_rate);
    s.put("mid_rate"_kj, scheduler.mid_rate);
    s.put("late_rate"_kj, scheduler.late_rate);
    s.put("diversity_threshold"_kj, scheduler.diversity_threshold);
    s.put("diversity_boost"_kj, scheduler.diversity_boost);
    s.put_object("initial_probabilities"_kj, [&](core::JsonBuilder& p) {
      for (auto& entry : scheduler.initial_probabilities) {
        p.put(entry.name, entry.probability);
      }
    });
    s.put("enable_adaptation"_kj, scheduler.enable_adaptation);
    s.put("success_rate_weight"_kj, scheduler.success_rate_weight);
    s.put("min_probability"_kj, scheduler.min_probability);
    s.put("update_interval"_kj, scheduler.update_interval);
  });
  builder.put_object("tier3"_kj, [&](core::JsonBuilder& t) {
    t.put("mutation_probability"_kj, tier3.mutation_probability);
    t.put("threshold_scale"_kj, tier3.threshold_scale);
  });
  return builder.build(pretty);
}

} // namespace evoguard::mutation
