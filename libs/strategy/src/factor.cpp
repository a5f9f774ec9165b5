#include "evoguard/strategy/factor.h"

#include "evoguard/snippet/parser.h"

#include <cmath>
#include <kj/debug.h>
#include <kj/memory.h>

namespace evoguard::strategy {

namespace {

constexpr ParameterSpec kMomentumParams[] = {
    {"window"_kj, 5, 60, 20, true},
    {"threshold"_kj, 0.005, 0.1, 0.02, false},
};

constexpr ParameterSpec kMaCrossParams[] = {
    {"fast"_kj, 3, 50, 10, true},
    {"slow"_kj, 10, 200, 30, true},
};

constexpr ParameterSpec kBreakoutParams[] = {
    {"window"_kj, 5, 100, 20, true},
};

constexpr ParameterSpec kVolatilityParams[] = {
    {"window"_kj, 5, 60, 20, true},
    {"max_vol"_kj, 0.005, 0.1, 0.03, false},
};

constexpr ParameterSpec kRsiParams[] = {
    {"window"_kj, 5, 30, 14, true},
    {"oversold"_kj, 10, 50, 30, false},
};

constexpr ParameterSpec kVolumeParams[] = {
    {"window"_kj, 5, 60, 20, true},
    {"ratio"_kj, 0.5, 3.0, 1.2, false},
};

constexpr kj::StringPtr kMomentumLogic = R"(def compute(data, window=20, threshold=0.02):
    close = data.get('close')
    return close.pct_change(window) > threshold
)"_kj;

constexpr kj::StringPtr kMaCrossLogic = R"(def compute(data, fast=10, slow=30):
    close = data.get('close')
    return close.rolling(fast).mean() > close.rolling(slow).mean() * 1.0
)"_kj;

constexpr kj::StringPtr kBreakoutLogic = R"(def compute(data, window=20):
    close = data.get('close')
    upper = data.get('high').rolling(window).max().shift(1)
    return close > upper * 0.98
)"_kj;

constexpr kj::StringPtr kVolatilityLogic = R"(def compute(data, window=20, max_vol=0.03):
    returns = data.get('close').pct_change(1)
    return returns.rolling(window).std() < max_vol
)"_kj;

constexpr kj::StringPtr kRsiLogic = R"(def compute(data, window=14, oversold=30):
    delta = data.get('close').diff(1)
    gain = (delta * (delta > 0)).rolling(window).mean()
    loss = (-delta * (delta < 0)).rolling(window).mean()
    rsi = 100 - 100 / (1 + gain / (loss + 1e-09))
    return rsi > oversold
)"_kj;

constexpr kj::StringPtr kVolumeLogic = R"(def compute(data, window=20, ratio=1.2):
    volume = data.get('volume')
    return volume > volume.rolling(window).mean() * ratio
)"_kj;

template <size_t N> kj::ArrayPtr<const ParameterSpec> specs(const ParameterSpec (&arr)[N]) {
  return kj::arrayPtr(arr, N);
}

} // namespace

double ParameterSpec::clamp(double value) const {
  double clamped = value < min ? min : (value > max ? max : value);
  return is_integer ? std::round(clamped) : clamped;
}

// ---------------------------------------------------------------------------
// Factor

Factor Factor::clone() const {
  Factor copy{kj::str(id), kj::str(type), kj::str(category), {}, {}, kj::str(logic)};
  for (auto& entry : parameters) {
    copy.parameters.insert(kj::str(entry.key), entry.value);
  }
  for (auto& dep : depends_on) {
    copy.depends_on.add(kj::str(dep));
  }
  return copy;
}

kj::Maybe<double> Factor::parameter(kj::StringPtr name) const {
  KJ_IF_SOME(value, parameters.find(name)) {
    return value;
  }
  return kj::none;
}

void Factor::set_parameter(kj::StringPtr name, double value) {
  parameters.upsert(kj::str(name), value, [](double& existing, double&& replacement) {
    existing = replacement;
  });
}

security::ValidationResult Factor::validate_logic() const {
  security::ValidationResult result;
  auto parsed = snippet::parse(logic);
  KJ_IF_SOME(error, parsed.tryGet<snippet::SyntaxError>()) {
    result.add_error(
        kj::str("Factor ", id, ": syntax error in logic: ", error.message, " at line ", error.line));
    return result;
  }

  auto& module = parsed.get<snippet::Module>();
  if (module.body.size() != 1 || module.body[0]->kind != snippet::Stmt::Kind::FunctionDef) {
    result.add_error(kj::str("Factor ", id, ": logic must be a single function definition"));
    return result;
  }
  auto& def = *module.body[0];
  if (def.params.size() == 0 || def.params[0].name != "data"_kj) {
    result.add_error(kj::str("Factor ", id, ": first logic parameter must be 'data'"));
    return result;
  }
  for (size_t i = 1; i < def.params.size(); ++i) {
    if (def.params[i].default_value == kj::none) {
      result.add_error(
          kj::str("Factor ", id, ": logic parameter '", def.params[i].name, "' needs a default"));
    }
  }
  for (auto& entry : parameters) {
    bool bound = false;
    for (auto& param : def.params) {
      if (param.name == entry.key) {
        bound = true;
        break;
      }
    }
    if (!bound) {
      result.add_warning(
          kj::str("Factor ", id, ": parameter '", entry.key, "' is not used by its logic"));
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// FactorRegistry

kj::Maybe<const ParameterSpec&> FactorDefinition::find_parameter(kj::StringPtr name) const {
  for (auto& pdef : parameters) {
    if (pdef.name == name) {
      return pdef;
    }
  }
  return kj::none;
}

const FactorRegistry& FactorRegistry::builtin() {
  static const kj::Own<FactorRegistry> registry = [] {
    auto r = kj::heap<FactorRegistry>();
    r->register_definition({"momentum"_kj, "entry"_kj, "price change over a window above a threshold"_kj,
                            specs(kMomentumParams), kMomentumLogic});
    r->register_definition({"ma_cross"_kj, "entry"_kj, "fast moving average above slow"_kj,
                            specs(kMaCrossParams), kMaCrossLogic});
    r->register_definition({"breakout"_kj, "entry"_kj, "close near the prior rolling high"_kj,
                            specs(kBreakoutParams), kBreakoutLogic});
    r->register_definition({"volatility_filter"_kj, "filter"_kj,
                            "rolling volatility of returns below a cap"_kj,
                            specs(kVolatilityParams), kVolatilityLogic});
    r->register_definition({"rsi"_kj, "entry"_kj, "relative strength index above a floor"_kj,
                            specs(kRsiParams), kRsiLogic});
    r->register_definition({"volume_filter"_kj, "filter"_kj, "volume above its rolling mean"_kj,
                            specs(kVolumeParams), kVolumeLogic});
    return r;
  }();
  return *registry;
}

void FactorRegistry::register_definition(FactorDefinition definition) {
  KJ_REQUIRE(find(definition.type) == kj::none, "factor type already registered", definition.type);
  for (auto& pdef : definition.parameters) {
    KJ_REQUIRE(pdef.min < pdef.max && pdef.contains(pdef.default_value), "invalid parameter bounds",
               definition.type, pdef.name);
  }
  definitions_.add(definition);
}

kj::Maybe<const FactorDefinition&> FactorRegistry::find(kj::StringPtr type) const {
  for (auto& def : definitions_) {
    if (def.type == type) {
      return def;
    }
  }
  return kj::none;
}

kj::Array<kj::StringPtr> FactorRegistry::types() const {
  auto builder = kj::heapArrayBuilder<kj::StringPtr>(definitions_.size());
  for (auto& def : definitions_) {
    builder.add(def.type);
  }
  return builder.finish();
}

Factor FactorRegistry::create(kj::StringPtr type, kj::StringPtr id) const {
  KJ_IF_SOME(def, find(type)) {
    Factor factor{kj::str(id), kj::str(def.type), kj::str(def.category), {}, {},
                  kj::str(def.logic_template)};
    for (auto& pdef : def.parameters) {
      factor.parameters.insert(kj::str(pdef.name), pdef.default_value);
    }
    return factor;
  }
  KJ_FAIL_REQUIRE("unknown factor type", type);
}

} // namespace evoguard::strategy
