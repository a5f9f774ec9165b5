#include "evoguard/mutation/tier1_config_mutator.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/strategy/config_validator.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

struct Leaf {
  size_t factor_index;
  kj::String factor_id;
  kj::String factor_type;
  kj::String parameter;
  double value;
};

struct Target {
  size_t factor_index;
  kj::StringPtr name;
  double value;
};

using Path = kj::Vector<kj::String>;

bool matches(const Path& path, kj::StringPtr key, const Target& target) {
  return path.size() == 3 && path[0] == "factors"_kj &&
         path[1] == kj::str(target.factor_index) && path[2] == "parameters"_kj &&
         key == target.name;
}

void copy_items(core::JsonBuilder& out, const core::JsonValue& array, Path& path,
                const Target& target);

void copy_members(core::JsonBuilder& out, const core::JsonValue& object, Path& path,
                  const Target& target) {
  object.for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
    if (matches(path, key, target)) {
      out.put(key, target.value);
    } else if (value.is_object()) {
      path.add(kj::str(key));
      out.put_object(key, [&](core::JsonBuilder& child) { copy_members(child, value, path, target); });
      path.removeLast();
    } else if (value.is_array()) {
      path.add(kj::str(key));
      out.put_array(key, [&](core::JsonBuilder& child) { copy_items(child, value, path, target); });
      path.removeLast();
    } else if (value.is_string()) {
      out.put(key, value.get_string().asPtr());
    } else if (value.is_bool()) {
      out.put(key, value.get_bool());
    } else if (value.is_int()) {
      out.put(key, value.get_int());
    } else if (value.is_number()) {
      out.put(key, value.get_double());
    } else {
      out.put(key, nullptr);
    }
  });
}

void copy_items(core::JsonBuilder& out, const core::JsonValue& array, Path& path,
                const Target& target) {
  size_t index = 0;
  array.for_each_array([&](const core::JsonValue& value) {
    path.add(kj::str(index++));
    if (value.is_object()) {
      out.add_object([&](core::JsonBuilder& child) { copy_members(child, value, path, target); });
    } else if (value.is_array()) {
      out.add_array([&](core::JsonBuilder& child) { copy_items(child, value, path, target); });
    } else if (value.is_string()) {
      out.add(value.get_string().asPtr());
    } else if (value.is_bool()) {
      out.add(value.get_bool());
    } else if (value.is_int()) {
      out.add(value.get_int());
    } else if (value.is_number()) {
      out.add(value.get_double());
    } else {
      out.add(nullptr);
    }
    path.removeLast();
  });
}

kj::Vector<Leaf> numeric_leaves(const core::JsonValue& root) {
  kj::Vector<Leaf> leaves;
  size_t index = 0;
  root["factors"].for_each_array([&](const core::JsonValue& factor) {
    factor["parameters"].for_each_object([&](kj::StringPtr name, const core::JsonValue& value) {
      if (value.is_number()) {
        leaves.add(Leaf{index, factor["id"].get_string(), factor["type"].get_string(),
                        kj::str(name), value.get_double()});
      }
    });
    ++index;
  });
  return leaves;
}

} // namespace

Tier1ConfigMutator::Tier1ConfigMutator(uint64_t seed, const strategy::FactorRegistry& registry,
                                       core::Logger& logger, double std_dev, bool validate)
    : registry_(registry), logger_(logger), std_dev_(std_dev), validate_(validate),
      random_(seed) {
  if (!(std_dev_ > 0.0)) {
    throw core::ConfigException(kj::str("Tier1 std_dev must be positive, got ", std_dev_));
  }
}

kj::String Tier1ConfigMutator::replace_parameter(kj::StringPtr config_json, size_t factor_index,
                                                 kj::StringPtr name, double value) {
  auto doc = core::JsonDocument::parse(config_json);
  auto out = core::JsonBuilder::object();
  Path path;
  copy_members(out, doc.root(), path, Target{factor_index, name, value});
  return out.build();
}

TierResult Tier1ConfigMutator::mutate(const strategy::Strategy& input,
                                      const MutationRequest& request) {
  auto json = input.to_config_json();
  auto doc = core::JsonDocument::parse(json);
  auto leaves = numeric_leaves(doc.root());
  if (leaves.empty()) {
    return TierFailure{kj::str("Strategy has no numeric configuration parameters"),
                       kj::str(kMutationType)};
  }

  double candidate = 0.0;
  size_t pick = 0;
  {
    auto random = random_.lockExclusive();
    pick = random->uniform_index(leaves.size());
    candidate = std::fabs(leaves[pick].value * (1.0 + random->gaussian(0.0, std_dev_)));
  }
  auto& leaf = leaves[pick];

  double new_value = candidate;
  KJ_IF_SOME(def, registry_.find(leaf.factor_type)) {
    KJ_IF_SOME(pdef, def.find_parameter(leaf.parameter)) {
      new_value = pdef.clamp(candidate);
    }
  }
  if (new_value == leaf.value) {
    return TierFailure{kj::str("Configuration mutation left ", leaf.factor_id, ".",
                               leaf.parameter, " unchanged"),
                       kj::str(kMutationType)};
  }

  auto mutated_json = replace_parameter(json, leaf.factor_index, leaf.parameter, new_value);

  if (validate_) {
    auto validation = strategy::StrategyConfigValidator(registry_).validate(mutated_json);
    if (!validation.success) {
      return TierFailure{kj::str("Configuration validation failed: ", validation.summary()),
                         kj::str(kMutationType)};
    }
  }

  strategy::Strategy rebuilt;
  try {
    rebuilt = strategy::Strategy::from_config_json(mutated_json);
  } catch (const core::ValidationException& e) {
    return TierFailure{kj::str("Configuration rebuild failed: ", e.message()),
                       kj::str(kMutationType)};
  }

  logger_.debug(kj::str("Tier1 generation ", request.generation, ": ", leaf.factor_id, ".",
                        leaf.parameter, " ", leaf.value, " -> ", new_value));

  Metadata metadata;
  set_metadata(metadata, "factor_id"_kj, kj::str(leaf.factor_id));
  set_metadata(metadata, "parameter"_kj, kj::str(leaf.parameter));
  set_metadata(metadata, "old_value"_kj, kj::str(leaf.value));
  set_metadata(metadata, "new_value"_kj, kj::str(new_value));
  return TierSuccess{kj::mv(rebuilt), kj::str(kMutationType), kj::mv(metadata)};
}

} // namespace evoguard::mutation
