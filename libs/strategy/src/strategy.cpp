#include "evoguard/strategy/strategy.h"

#include "evoguard/core/error.h"
#include "evoguard/core/json.h"
#include "evoguard/snippet/parser.h"
#include "evoguard/snippet/printer.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::strategy {

namespace {

constexpr kj::StringPtr kDefaultExitCode = R"(stop_loss_pct = 0.10
take_profit_pct = 0.20
trailing_stop_offset = 0.02
holding_period_days = 20
)"_kj;

enum class Mark : uint8_t { Unvisited, Active, Done };

struct CycleSearch {
  kj::ArrayPtr<const kj::StringPtr> ids;
  kj::ArrayPtr<const kj::Array<kj::StringPtr>> deps;
  kj::Array<Mark> marks;
  kj::Vector<size_t> path;

  kj::Maybe<size_t> index_of(kj::StringPtr id) const {
    for (size_t i = 0; i < ids.size(); ++i) {
      if (ids[i] == id) {
        return i;
      }
    }
    return kj::none;
  }

  kj::Maybe<kj::String> visit(size_t node) {
    marks[node] = Mark::Active;
    path.add(node);
    for (auto dep : deps[node]) {
      KJ_IF_SOME(next, index_of(dep)) {
        if (marks[next] == Mark::Active) {
          kj::Vector<kj::StringPtr> cycle;
          bool in_cycle = false;
          for (size_t p : path) {
            in_cycle = in_cycle || p == next;
            if (in_cycle) {
              cycle.add(ids[p]);
            }
          }
          cycle.add(ids[next]);
          return kj::str("Circular dependency detected: ", kj::strArray(cycle, " -> "));
        }
        if (marks[next] == Mark::Unvisited) {
          KJ_IF_SOME(found, visit(next)) {
            return kj::mv(found);
          }
        }
      }
    }
    path.removeLast();
    marks[node] = Mark::Done;
    return kj::none;
  }
};

bool is_identifier_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Rendered factor function with parameters bound as keyword defaults
kj::String render_factor(const Factor& factor) {
  auto module = snippet::parse_or_throw(factor.logic);
  KJ_REQUIRE(module.body.size() == 1 && module.body[0]->kind == snippet::Stmt::Kind::FunctionDef,
             "factor logic must be a single function", factor.id);
  auto& def = *module.body[0];
  def.name = kj::str("factor_", factor_function_name(factor.id));
  for (auto& param : def.params) {
    KJ_IF_SOME(value, factor.parameter(param.name)) {
      bool integer_literal = false;
      KJ_IF_SOME(existing, param.default_value) {
        integer_literal = existing->kind == snippet::Expr::Kind::Number && existing->is_integer &&
                          std::floor(value) == value;
      }
      param.default_value = snippet::make_number(value, integer_literal, def.line);
    }
  }
  return snippet::print(def);
}

} // namespace

kj::StringPtr default_exit_code() {
  return kDefaultExitCode;
}

Strategy::Strategy(kj::String id, kj::Vector<Factor> factors, kj::String exit_code)
    : id_(kj::mv(id)), factors_(kj::mv(factors)), exit_code_(kj::mv(exit_code)) {}

Strategy Strategy::clone() const {
  kj::Vector<Factor> copies(factors_.size());
  for (auto& factor : factors_) {
    copies.add(factor.clone());
  }
  return Strategy(kj::str(id_), kj::mv(copies), kj::str(exit_code_));
}

kj::Maybe<const Factor&> Strategy::find_factor(kj::StringPtr factor_id) const {
  for (auto& factor : factors_) {
    if (factor.id == factor_id) {
      return factor;
    }
  }
  return kj::none;
}

kj::Maybe<Factor&> Strategy::find_factor(kj::StringPtr factor_id) {
  for (auto& factor : factors_) {
    if (factor.id == factor_id) {
      return factor;
    }
  }
  return kj::none;
}

security::ValidationResult Strategy::validate() const {
  security::ValidationResult result;

  if (factors_.empty()) {
    result.add_error(kj::str("Strategy ", id_, " has no factors"));
  }

  for (size_t i = 0; i < factors_.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (factors_[i].id == factors_[j].id) {
        result.add_error(kj::str("Duplicate factor ID: ", factors_[i].id));
        break;
      }
    }
    for (auto& dep : factors_[i].depends_on) {
      if (find_factor(dep) == kj::none) {
        result.add_error(kj::str("Factor ", factors_[i].id, " depends on unknown factor ", dep));
      }
    }
  }

  auto ids = KJ_MAP(f, factors_) -> kj::StringPtr { return f.id; };
  auto deps = KJ_MAP(f, factors_) {
    return KJ_MAP(d, f.depends_on) -> kj::StringPtr { return d; };
  };
  KJ_IF_SOME(cycle, find_dependency_cycle(ids, deps)) {
    result.add_error(kj::mv(cycle));
  }

  kj::Vector<security::ValidationResult> parts;
  parts.add(kj::mv(result));
  for (auto& factor : factors_) {
    parts.add(factor.validate_logic());
  }
  auto combined = security::ValidationResult::aggregate(parts.asPtr());

  KJ_IF_SOME(error, snippet::check_syntax(exit_code_)) {
    combined.add_error(
        kj::str("Exit block syntax error: ", error.message, " at line ", error.line));
  }
  return combined;
}

kj::Array<size_t> Strategy::dependency_order() const {
  auto ids = KJ_MAP(f, factors_) -> kj::StringPtr { return f.id; };
  auto deps = KJ_MAP(f, factors_) {
    return KJ_MAP(d, f.depends_on) -> kj::StringPtr { return d; };
  };
  KJ_IF_SOME(cycle, find_dependency_cycle(ids, deps)) {
    KJ_FAIL_REQUIRE("cannot order factors", cycle);
  }

  kj::Vector<size_t> order(factors_.size());
  auto placed = kj::heapArray<bool>(factors_.size());
  for (auto& p : placed) {
    p = false;
  }
  // Kahn-style passes; the graph is known to be acyclic
  while (order.size() < factors_.size()) {
    for (size_t i = 0; i < factors_.size(); ++i) {
      if (placed[i]) {
        continue;
      }
      bool ready = true;
      for (auto& dep : factors_[i].depends_on) {
        for (size_t j = 0; j < factors_.size(); ++j) {
          if (factors_[j].id == dep && !placed[j]) {
            ready = false;
          }
        }
      }
      if (ready) {
        placed[i] = true;
        order.add(i);
      }
    }
  }
  return order.releaseAsArray();
}

kj::String Strategy::to_code() const {
  kj::Vector<kj::String> sections;
  auto order = dependency_order();
  for (size_t index : order) {
    sections.add(render_factor(factors_[index]));
  }

  kj::Vector<kj::String> body;
  body.add(kj::str("def strategy(data, params):\n"));
  if (order.size() == 0) {
    body.add(kj::str("    return None\n"));
  } else {
    for (size_t i = 0; i < order.size(); ++i) {
      auto fn = factor_function_name(factors_[order[i]].id);
      if (i == 0) {
        body.add(kj::str("    signal = factor_", fn, "(data)\n"));
      } else {
        body.add(kj::str("    signal = signal & factor_", fn, "(data)\n"));
      }
    }
    body.add(kj::str("    return signal\n"));
  }
  sections.add(kj::strArray(body, ""));
  sections.add(kj::str(exit_code_));
  return kj::strArray(sections, "\n");
}

kj::String Strategy::to_config_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put("strategy_id"_kj, id_.asPtr());
  builder.put_array("factors"_kj, [&](core::JsonBuilder& factors) {
    for (auto& factor : factors_) {
      factors.add_object([&](core::JsonBuilder& obj) {
        obj.put("id"_kj, factor.id.asPtr());
        obj.put("type"_kj, factor.type.asPtr());
        obj.put("category"_kj, factor.category.asPtr());
        obj.put_object("parameters"_kj, [&](core::JsonBuilder& params) {
          for (auto& entry : factor.parameters) {
            params.put(entry.key.asPtr(), entry.value);
          }
        });
        obj.put_array("depends_on"_kj, [&](core::JsonBuilder& deps) {
          for (auto& dep : factor.depends_on) {
            deps.add(dep.asPtr());
          }
        });
        obj.put("logic"_kj, factor.logic.asPtr());
      });
    }
  });
  builder.put("exit_code"_kj, exit_code_.asPtr());
  return builder.build(pretty);
}

Strategy Strategy::from_config_json(kj::StringPtr json) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse(json); })) {
    throw core::ValidationException(
        kj::str("Invalid strategy JSON: ", exception.getDescription()));
  }

  auto root = doc.root();
  if (!root.is_object()) {
    throw core::ValidationException("Strategy JSON must be an object"_kj);
  }
  if (!root["strategy_id"].is_string()) {
    throw core::ValidationException("Strategy JSON is missing 'strategy_id'"_kj);
  }
  if (!root["factors"].is_array()) {
    throw core::ValidationException("Strategy JSON is missing 'factors'"_kj);
  }

  const auto& registry = FactorRegistry::builtin();
  kj::Vector<Factor> factors;
  kj::Maybe<kj::String> problem;
  root["factors"].for_each_array([&](const core::JsonValue& item) {
    if (problem != kj::none) {
      return;
    }
    if (!item["id"].is_string() || !item["type"].is_string()) {
      problem = kj::str("every factor needs string 'id' and 'type'");
      return;
    }
    Factor factor;
    factor.id = item["id"].get_string();
    factor.type = item["type"].get_string();

    kj::Maybe<const FactorDefinition&> def = registry.find(factor.type);
    kj::StringPtr default_category = "entry"_kj;
    kj::StringPtr default_logic = ""_kj;
    KJ_IF_SOME(d, def) {
      default_category = d.category;
      default_logic = d.logic_template;
    }
    factor.category = item["category"].get_string(default_category);
    factor.logic = item["logic"].get_string(default_logic);
    if (factor.logic.size() == 0) {
      problem = kj::str("factor ", factor.id, " has no logic and an unknown type");
      return;
    }

    item["parameters"].for_each_object([&](kj::StringPtr name, const core::JsonValue& value) {
      if (!value.is_number()) {
        problem = kj::str("parameter ", name, " of factor ", factor.id, " is not a number");
        return;
      }
      factor.set_parameter(name, value.get_double());
    });
    item["depends_on"].for_each_array([&](const core::JsonValue& dep) {
      if (!dep.is_string()) {
        problem = kj::str("depends_on of factor ", factor.id, " must hold strings");
        return;
      }
      factor.depends_on.add(dep.get_string());
    });
    factors.add(kj::mv(factor));
  });

  KJ_IF_SOME(message, problem) {
    throw core::ValidationException(kj::str("Invalid strategy JSON: ", message));
  }

  return Strategy(root["strategy_id"].get_string(), kj::mv(factors),
                  root["exit_code"].get_string(kDefaultExitCode));
}

kj::Maybe<kj::String> find_dependency_cycle(kj::ArrayPtr<const kj::StringPtr> ids,
                                            kj::ArrayPtr<const kj::Array<kj::StringPtr>> depends_on) {
  KJ_REQUIRE(ids.size() == depends_on.size());
  CycleSearch search{ids, depends_on, kj::heapArray<Mark>(ids.size()), {}};
  for (auto& m : search.marks) {
    m = Mark::Unvisited;
  }
  for (size_t i = 0; i < ids.size(); ++i) {
    if (search.marks[i] == Mark::Unvisited) {
      KJ_IF_SOME(cycle, search.visit(i)) {
        return kj::mv(cycle);
      }
    }
  }
  return kj::none;
}

kj::String factor_function_name(kj::StringPtr factor_id) {
  auto out = kj::heapString(factor_id);
  for (auto& c : out) {
    if (!is_identifier_char(c)) {
      c = '_';
    }
  }
  return out;
}

Strategy make_default_strategy(kj::StringPtr id) {
  const auto& registry = FactorRegistry::builtin();
  kj::Vector<Factor> factors;
  factors.add(registry.create("momentum"_kj, "momentum_1"_kj));
  auto filter = registry.create("volatility_filter"_kj, "vol_filter_1"_kj);
  filter.depends_on.add(kj::str("momentum_1"));
  factors.add(kj::mv(filter));
  return Strategy(kj::str(id), kj::mv(factors), kj::str(kDefaultExitCode));
}

} // namespace evoguard::strategy
