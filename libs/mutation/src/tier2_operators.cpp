#include "evoguard/mutation/tier2_operators.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::mutation {

namespace {

bool has_dependents(const strategy::Strategy& s, kj::StringPtr id) {
  for (auto& factor : s.factors()) {
    for (auto& dep : factor.depends_on) {
      if (dep == id) {
        return true;
      }
    }
  }
  return false;
}

OperatorResult validated(strategy::Strategy candidate, kj::StringPtr operator_name) {
  auto validation = candidate.validate();
  if (!validation.success) {
    return kj::str(operator_name, " produced an invalid strategy: ", validation.summary());
  }
  return kj::mv(candidate);
}

} // namespace

kj::String unique_factor_id(const strategy::Strategy& strategy, kj::StringPtr type) {
  for (size_t n = 1;; ++n) {
    auto id = kj::str(type, "_", n);
    if (strategy.find_factor(id) == kj::none) {
      return id;
    }
  }
}

OperatorResult AddFactorOperator::apply(const strategy::Strategy& input, core::Random& random) {
  if (input.factors().size() >= max_factors_) {
    return kj::str("Strategy already has ", input.factors().size(), " factors (limit ",
                   max_factors_, ")");
  }
  auto types = registry_.types();
  if (types.size() == 0) {
    return kj::str("Factor registry is empty");
  }
  auto type = types[random.uniform_index(types.size())];

  auto copy = input.clone();
  auto factor = registry_.create(type, unique_factor_id(copy, type));
  if (factor.category == "filter"_kj) {
    for (auto& existing : copy.factors()) {
      if (!has_dependents(copy, existing.id)) {
        factor.depends_on.add(kj::str(existing.id));
      }
    }
  }
  copy.mutable_factors().add(kj::mv(factor));
  return validated(kj::mv(copy), name());
}

OperatorResult RemoveFactorOperator::apply(const strategy::Strategy& input, core::Random& random) {
  auto factors = input.factors();
  if (factors.size() <= 1) {
    return kj::str("Cannot remove factor: the strategy has ", factors.size(), " factor(s)");
  }

  size_t entry_count = 0;
  for (auto& factor : factors) {
    if (factor.category == "entry"_kj) {
      ++entry_count;
    }
  }

  kj::Vector<size_t> candidates;
  for (size_t i = 0; i < factors.size(); ++i) {
    if (has_dependents(input, factors[i].id)) {
      continue;
    }
    if (factors[i].category == "entry"_kj && entry_count <= 1) {
      continue;
    }
    candidates.add(i);
  }
  if (candidates.empty()) {
    return kj::str("No removable factor: every factor has dependents or is the only entry factor");
  }

  size_t victim = candidates[random.uniform_index(candidates.size())];
  kj::Vector<strategy::Factor> remaining(factors.size() - 1);
  for (size_t i = 0; i < factors.size(); ++i) {
    if (i != victim) {
      remaining.add(factors[i].clone());
    }
  }
  return validated(
      strategy::Strategy(kj::str(input.id()), kj::mv(remaining), kj::str(input.exit_code())),
      name());
}

OperatorResult ReplaceFactorOperator::apply(const strategy::Strategy& input,
                                            core::Random& random) {
  auto factors = input.factors();
  if (factors.size() == 0) {
    return kj::str("Strategy has no factors to replace");
  }
  size_t index = random.uniform_index(factors.size());
  auto& old_factor = factors[index];

  kj::Vector<kj::StringPtr> alternatives;
  for (auto type : registry_.types()) {
    KJ_IF_SOME(def, registry_.find(type)) {
      if (def.category == old_factor.category && type != old_factor.type) {
        alternatives.add(type);
      }
    }
  }
  if (alternatives.empty()) {
    return kj::str("No replacement of category '", old_factor.category, "' for factor '",
                   old_factor.id, "'");
  }
  auto new_type = alternatives[random.uniform_index(alternatives.size())];

  auto copy = input.clone();
  auto replacement = registry_.create(new_type, unique_factor_id(copy, new_type));
  for (auto& dep : old_factor.depends_on) {
    replacement.depends_on.add(kj::str(dep));
  }
  auto old_id = kj::str(old_factor.id);
  for (auto& factor : copy.mutable_factors()) {
    for (auto& dep : factor.depends_on) {
      if (dep == old_id) {
        dep = kj::str(replacement.id);
      }
    }
  }
  copy.mutable_factors()[index] = kj::mv(replacement);
  return validated(kj::mv(copy), name());
}

OperatorResult ParameterMutationOperator::apply(const strategy::Strategy& input,
                                                core::Random& random) {
  kj::Vector<size_t> candidates;
  for (size_t i = 0; i < input.factors().size(); ++i) {
    if (input.factors()[i].parameters.size() > 0) {
      candidates.add(i);
    }
  }
  if (candidates.empty()) {
    return kj::str("No factor has parameters to mutate");
  }

  auto copy = input.clone();
  auto& factor = copy.mutable_factors()[candidates[random.uniform_index(candidates.size())]];
  kj::Maybe<const strategy::FactorDefinition&> def = registry_.find(factor.type);

  size_t forced = random.uniform_index(factor.parameters.size());
  size_t position = 0;
  bool changed = false;
  for (auto& entry : factor.parameters) {
    bool pick = position++ == forced || random.bernoulli(0.5);
    if (!pick) {
      continue;
    }
    double value = std::fabs(entry.value * (1.0 + random.gaussian(0.0, std_dev_)));
    KJ_IF_SOME(d, def) {
      KJ_IF_SOME(pdef, d.find_parameter(entry.key)) {
        value = pdef.clamp(value);
      }
    }
    if (value != entry.value) {
      entry.value = value;
      changed = true;
    }
  }
  if (!changed) {
    return kj::str("Parameter mutation left factor '", factor.id, "' unchanged");
  }
  return validated(kj::mv(copy), name());
}

kj::Array<kj::Own<IMutationOperator>>
make_default_operators(const strategy::FactorRegistry& registry) {
  auto builder = kj::heapArrayBuilder<kj::Own<IMutationOperator>>(4);
  builder.add(kj::heap<AddFactorOperator>(registry));
  builder.add(kj::heap<RemoveFactorOperator>());
  builder.add(kj::heap<ReplaceFactorOperator>(registry));
  builder.add(kj::heap<ParameterMutationOperator>(registry));
  return builder.finish();
}

} // namespace evoguard::mutation
