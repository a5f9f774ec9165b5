#include "evoguard/mutation/exit_parameter_mutator.h"

#include "evoguard/core/error.h"
#include "evoguard/snippet/parser.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <kj/debug.h>
#include <regex>
#include <string>

namespace evoguard::mutation {

namespace {

struct Site {
  size_t begin;
  size_t length;
  double value;
};

// First `name = <number>`; the word boundary keeps `x_stop_loss_pct` out and
// the `\s*=` keeps `stop_loss_pct_max` out.
kj::Maybe<Site> find_site(kj::StringPtr code, kj::StringPtr name) {
  std::string pattern = std::string("\\b") + name.cStr() +
                        "\\s*=\\s*(-?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][-+]?\\d+)?)";
  std::regex re(pattern);
  std::cmatch match;
  if (!std::regex_search(code.begin(), code.end(), match, re)) {
    return kj::none;
  }
  auto text = match.str(1);
  return Site{static_cast<size_t>(match.position(1)), static_cast<size_t>(match.length(1)),
              std::strtod(text.c_str(), nullptr)};
}

} // namespace

ExitParameterMutator::ExitParameterMutator(const ExitMutationConfig& config, uint64_t seed,
                                           core::Logger& logger)
    : config_(config), logger_(logger), state_(State{core::Random(seed), {}}) {
  if (!(config_.gaussian_std_dev > 0.0)) {
    throw core::ConfigException(
        kj::str("gaussian_std_dev must be positive, got ", config_.gaussian_std_dev));
  }
  for (auto& b : config_.all_bounds()) {
    if (!(b.min < b.max) || !b.contains(b.default_value)) {
      throw core::ConfigException(kj::str("Invalid bounds for ", b.parameter_name, ": [", b.min,
                                          ", ", b.max, "] default ", b.default_value));
    }
  }
}

kj::Maybe<double> ExitParameterMutator::find_value(kj::StringPtr code,
                                                   kj::StringPtr parameter_name) {
  KJ_IF_SOME(site, find_site(code, parameter_name)) {
    return site.value;
  }
  return kj::none;
}

kj::String ExitParameterMutator::format_value(double value, bool is_integer) {
  if (is_integer) {
    return kj::str(static_cast<int64_t>(std::llround(value)));
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.6f", value);
  return kj::str(buffer);
}

ExitMutationResult ExitParameterMutator::fail(kj::StringPtr code, ExitMutationMetadata metadata,
                                              kj::String error) {
  logger_.debug(kj::str("Exit mutation of ", metadata.parameter_name, " failed: ", error));
  ExitMutationResult result;
  result.mutated_code = kj::str(code);
  result.success = false;
  result.metadata = kj::mv(metadata);
  result.error = kj::mv(error);
  return result;
}

ExitMutationResult ExitParameterMutator::mutate(kj::StringPtr code,
                                                kj::Maybe<kj::StringPtr> parameter_name) {
  auto lock = state_.lockExclusive();
  auto& stats = lock->stats;
  ++stats.total;

  const ParameterBounds* bounds = nullptr;
  KJ_IF_SOME(name, parameter_name) {
    KJ_IF_SOME(found, config_.find_bounds(name)) {
      bounds = &found;
    } else {
      return fail(code, ExitMutationMetadata{kj::str(name)}, kj::str("Unknown parameter: ", name));
    }
  } else {
    bounds = &config_.bounds[lock->random.uniform_index(kExitParameterCount)];
  }

  ExitMutationMetadata metadata{kj::str(bounds->parameter_name)};

  Site site;
  KJ_IF_SOME(found, find_site(code, bounds->parameter_name)) {
    site = found;
  } else {
    ++stats.failed_regex;
    return fail(code, kj::mv(metadata),
                kj::str("Parameter ", bounds->parameter_name, " not found in code"));
  }
  metadata.old_value = site.value;

  double noise = lock->random.gaussian(0.0, config_.gaussian_std_dev);
  double candidate = std::fabs(site.value * (1.0 + noise));
  if (bounds->is_integer) {
    candidate = std::round(candidate);
  }
  double new_value = bounds->clamp(candidate);
  metadata.clamped = new_value != candidate;
  metadata.new_value = new_value;
  if (metadata.clamped) {
    logger_.info(kj::str("Clamped ", bounds->parameter_name, " from ", candidate, " to ",
                         new_value, " (bounds [", bounds->min, ", ", bounds->max, "])"));
  }

  auto replacement = format_value(new_value, bounds->is_integer);
  auto mutated = kj::str(kj::heapString(code.begin(), site.begin), replacement,
                         kj::heapString(code.begin() + site.begin + site.length,
                                        code.size() - site.begin - site.length));

  KJ_IF_SOME(error, snippet::check_syntax(mutated)) {
    ++stats.failed_validation;
    return fail(code, kj::mv(metadata),
                kj::str("Mutated code failed validation: ", error.message, " at line ",
                        error.line));
  }

  ++stats.success;
  if (metadata.clamped) {
    ++stats.clamped;
  }
  ExitMutationResult result;
  result.mutated_code = kj::mv(mutated);
  result.success = true;
  result.metadata = kj::mv(metadata);
  result.validation_passed = true;
  return result;
}

ExitMutationStatistics ExitParameterMutator::get_statistics() const {
  return state_.lockShared()->stats;
}

void ExitParameterMutator::reset_statistics() {
  state_.lockExclusive()->stats = ExitMutationStatistics();
}

} // namespace evoguard::mutation
