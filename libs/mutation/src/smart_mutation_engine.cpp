#include "evoguard/mutation/smart_mutation_engine.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"

#include <cstdlib>
#include <kj/debug.h>

namespace evoguard::mutation {

kj::String SmartEngineStatistics::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put_object("operator_attempts", [&](core::JsonBuilder& b) {
    for (auto& entry : operators) {
      b.put(entry.key, entry.value.attempts);
    }
  });
  builder.put_object("operator_successes", [&](core::JsonBuilder& b) {
    for (auto& entry : operators) {
      b.put(entry.key, entry.value.successes);
    }
  });
  builder.put_object("operator_failures", [&](core::JsonBuilder& b) {
    for (auto& entry : operators) {
      b.put(entry.key, entry.value.failures);
    }
  });
  builder.put_object("success_rates", [&](core::JsonBuilder& b) {
    for (auto& entry : operators) {
      b.put(entry.key, entry.value.success_rate());
    }
  });
  builder.put("total_attempts", total_attempts);
  builder.put("total_successes", total_successes);
  return builder.build(pretty);
}

SmartMutationEngine::SmartMutationEngine(kj::Array<kj::Own<IMutationOperator>> operators,
                                         SchedulerConfig config, uint64_t seed,
                                         core::Logger& logger)
    : operators_(kj::mv(operators)), scheduler_(kj::mv(config)), logger_(logger),
      state_(State{core::Random(seed), {}, kj::none}) {
  if (operators_.size() == 0) {
    throw core::ConfigException("Must provide at least one mutation operator"_kj);
  }
  for (auto& entry : scheduler_.config().initial_probabilities) {
    if (find_operator(entry.name) == kj::none) {
      throw core::ConfigException(kj::str("Operator '", entry.name,
                                          "' in initial_probabilities not found in operator set"));
    }
  }

  // Operators the initial table leaves out start at the floor.
  auto weights = kj::heapArrayBuilder<double>(operators_.size());
  for (auto& op : operators_) {
    double weight = scheduler_.config().min_probability;
    for (auto& entry : scheduler_.config().initial_probabilities) {
      if (entry.name == op->name()) {
        weight = entry.probability;
        break;
      }
    }
    weights.add(weight);
  }
  initial_weights_ = weights.finish();
}

kj::Own<SmartMutationEngine>
SmartMutationEngine::with_default_operators(const SchedulerConfig& config, uint64_t seed,
                                            const strategy::FactorRegistry& registry,
                                            core::Logger& logger) {
  return kj::heap<SmartMutationEngine>(make_default_operators(registry), config.clone(), seed,
                                       logger);
}

kj::Maybe<IMutationOperator&> SmartMutationEngine::find_operator(kj::StringPtr name) {
  for (auto& op : operators_) {
    if (op->name() == name) {
      return *op;
    }
  }
  return kj::none;
}

kj::Array<kj::StringPtr> SmartMutationEngine::operator_names() const {
  return KJ_MAP(op, operators_) { return op->name(); };
}

kj::Array<double> SmartMutationEngine::compute_weights(int generation,
                                                       const OperatorStats& stats) const {
  auto phase_table = scheduler_.get_operator_probabilities(generation, stats.get_all_rates());

  auto weights = kj::heapArray<double>(operators_.size());
  double total = 0.0;
  for (size_t i = 0; i < operators_.size(); ++i) {
    weights[i] = initial_weights_[i];
    KJ_IF_SOME(p, phase_table.find(operators_[i]->name())) {
      weights[i] = p;
    }
    total += weights[i];
  }
  for (auto& w : weights) {
    w = total > 0.0 ? w / total : 1.0 / static_cast<double>(weights.size());
  }
  return weights;
}

kj::ArrayPtr<const double> SmartMutationEngine::current_weights(State& state, int generation) {
  auto phase = scheduler_.phase(generation);
  bool stale = true;
  KJ_IF_SOME(cache, state.cache) {
    stale = std::abs(generation - cache.generation) >= scheduler_.config().update_interval ||
            cache.phase != phase;
  }
  if (stale) {
    state.cache = ProbabilityCache{generation, phase, compute_weights(generation, state.stats)};
  }
  KJ_IF_SOME(cache, state.cache) {
    return cache.weights;
  }
  KJ_UNREACHABLE;
}

size_t SmartMutationEngine::draw(State& state, int generation) {
  auto weights = current_weights(state, generation);
  return state.random.weighted_index(weights);
}

kj::StringPtr SmartMutationEngine::select_operator(int generation) {
  auto lock = state_.lockExclusive();
  return operators_[draw(*lock, generation)]->name();
}

OperatorProbabilities SmartMutationEngine::get_current_probabilities(int generation) {
  auto lock = state_.lockExclusive();
  auto weights = current_weights(*lock, generation);
  OperatorProbabilities result;
  for (size_t i = 0; i < operators_.size(); ++i) {
    result.upsert(kj::str(operators_[i]->name()), weights[i],
                  [](double& existing, double&& replacement) { existing += replacement; });
  }
  return result;
}

void SmartMutationEngine::update_success_rate(kj::StringPtr operator_name, bool success) {
  state_.lockExclusive()->stats.record(operator_name, success);
}

TierResult SmartMutationEngine::mutate(const strategy::Strategy& input,
                                       const MutationRequest& request) {
  auto lock = state_.lockExclusive();

  IMutationOperator* op = nullptr;
  KJ_IF_SOME(name, request.operator_name) {
    KJ_IF_SOME(found, find_operator(name)) {
      op = &found;
    } else {
      return TierFailure{kj::str("Unknown Tier2 operator: ", name), kj::str(name)};
    }
  } else {
    op = operators_[draw(*lock, request.generation)].get();
  }

  auto result = op->apply(input, lock->random);
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(mutated, strategy::Strategy) {
      lock->stats.record(op->name(), true);
      Metadata metadata;
      set_metadata(metadata, "operator"_kj, kj::str(op->name()));
      set_metadata(metadata, "phase"_kj,
                   kj::str(to_string(scheduler_.phase(request.generation))));
      set_metadata(metadata, "factor_count"_kj, kj::str(mutated.factors().size()));
      return TierSuccess{kj::mv(mutated), kj::str(op->name()), kj::mv(metadata)};
    }
    KJ_CASE_ONEOF(error, kj::String) {
      lock->stats.record(op->name(), false);
      logger_.debug(kj::str("Tier2 operator ", op->name(), " failed: ", error));
      return TierFailure{kj::mv(error), kj::str(op->name())};
    }
  }
  KJ_UNREACHABLE;
}

SmartEngineStatistics SmartMutationEngine::get_statistics() const {
  auto lock = state_.lockShared();
  SmartEngineStatistics stats;
  for (auto& entry : lock->stats.all()) {
    stats.operators.insert(kj::str(entry.key), entry.value);
    stats.total_attempts += entry.value.attempts;
    stats.total_successes += entry.value.successes;
  }
  return stats;
}

void SmartMutationEngine::reset_statistics() {
  auto lock = state_.lockExclusive();
  lock->stats.clear();
  lock->cache = kj::none;
}

} // namespace evoguard::mutation
