#include "evoguard/strategy/config_validator.h"

#include "evoguard/strategy/strategy.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::strategy {

security::ValidationResult StrategyConfigValidator::validate(kj::StringPtr json) const {
  core::JsonDocument doc;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse(json); })) {
    return security::ValidationResult::failure(
        kj::str("Invalid JSON: ", exception.getDescription()));
  }
  return validate(doc.root());
}

security::ValidationResult StrategyConfigValidator::validate(const core::JsonValue& root) const {
  security::ValidationResult result;

  if (!root.is_object()) {
    result.add_error(kj::str("Configuration must be a JSON object"));
    return result;
  }
  if (!root["strategy_id"].is_string()) {
    result.add_error(kj::str("Missing strategy_id"));
  }
  auto factors = root["factors"];
  if (!factors.is_array()) {
    result.add_error(kj::str("Missing factors array"));
    return result;
  }
  if (factors.size() == 0) {
    result.add_error(kj::str("Strategy has no factors"));
    return result;
  }

  kj::Vector<kj::String> ids;
  kj::Vector<kj::Array<kj::StringPtr>> deps;
  kj::Vector<kj::Vector<kj::String>> dep_storage;

  for (size_t i = 0; i < factors.size(); ++i) {
    auto factor = factors[i];
    kj::String id = factor["id"].get_string();
    if (id.size() == 0) {
      result.add_error(kj::str("Factor at index ", i, " has no id"));
      id = kj::str("#", i);
    }
    for (auto& existing : ids) {
      if (existing == id) {
        result.add_error(kj::str("Duplicate factor ID: ", id));
        break;
      }
    }

    kj::Vector<kj::String> factor_deps;
    factor["depends_on"].for_each_array([&](const core::JsonValue& dep) {
      factor_deps.add(dep.get_string());
    });
    dep_storage.add(kj::mv(factor_deps));

    kj::String type = factor["type"].get_string();
    KJ_IF_SOME(def, registry_.find(type)) {
      auto params = factor["parameters"];
      for (auto& pdef : def.parameters) {
        KJ_IF_SOME(value, params.get(pdef.name)) {
          if (!value.is_number()) {
            result.add_error(
                kj::str("Parameter '", pdef.name, "' of factor ", id, " must be a number"));
            continue;
          }
          double v = value.get_double();
          if (!pdef.contains(v)) {
            result.add_error(kj::str("Parameter '", pdef.name, "' of factor ", id,
                                     " out of bounds: ", v, " not in [", pdef.min, ", ", pdef.max,
                                     "]"));
          } else if (pdef.is_integer && std::floor(v) != v) {
            result.add_error(
                kj::str("Parameter '", pdef.name, "' of factor ", id, " must be an integer"));
          }
        } else {
          result.add_error(kj::str("Missing parameter '", pdef.name, "' for factor ", id));
        }
      }
      params.for_each_object([&](kj::StringPtr name, const core::JsonValue&) {
        if (def.find_parameter(name) == kj::none) {
          result.add_warning(kj::str("Unknown parameter '", name, "' for factor ", id));
        }
      });
    } else {
      result.add_error(kj::str("Unknown factor type: ", type, " (factor ", id, ")"));
    }

    ids.add(kj::mv(id));
  }

  for (size_t i = 0; i < ids.size(); ++i) {
    for (auto& dep : dep_storage[i]) {
      bool known = false;
      for (auto& id : ids) {
        known = known || id == dep;
      }
      if (!known) {
        result.add_error(kj::str("Factor ", ids[i], " depends on unknown factor ", dep));
      }
    }
    deps.add(KJ_MAP(d, dep_storage[i]) -> kj::StringPtr { return d; });
  }

  auto id_ptrs = KJ_MAP(id, ids) -> kj::StringPtr { return id; };
  KJ_IF_SOME(cycle, find_dependency_cycle(id_ptrs, deps.asPtr())) {
    result.add_error(kj::mv(cycle));
  }

  return result;
}

} // namespace evoguard::strategy
