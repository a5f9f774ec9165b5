#include "evoguard/core/random.h"

#include <kj/debug.h>

namespace evoguard::core {

Random Random::from_entropy() {
  std::random_device rd;
  uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
  return Random(seed);
}

double Random::gaussian(double mean, double std_dev) {
  KJ_REQUIRE(std_dev >= 0.0, "standard deviation must be non-negative", std_dev);
  if (std_dev == 0.0) {
    return mean;
  }
  std::normal_distribution<double> dist(mean, std_dev);
  return dist(engine_);
}

double Random::uniform(double lo, double hi) {
  KJ_REQUIRE(lo <= hi, "empty range", lo, hi);
  if (lo == hi) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

size_t Random::uniform_index(size_t n) {
  KJ_REQUIRE(n > 0, "cannot choose from an empty range");
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(engine_);
}

bool Random::bernoulli(double p) {
  if (p <= 0.0) {
    return false;
  }
  if (p >= 1.0) {
    return true;
  }
  return uniform(0.0, 1.0) < p;
}

size_t Random::weighted_index(kj::ArrayPtr<const double> weights) {
  KJ_REQUIRE(weights.size() > 0, "cannot choose from an empty distribution");
  double total = 0.0;
  for (double w : weights) {
    KJ_REQUIRE(w >= 0.0, "negative weight", w);
    total += w;
  }
  if (total <= 0.0) {
    return uniform_index(weights.size());
  }
  double r = uniform(0.0, total);
  double acc = 0.0;
  for (size_t i = 0; i < weights.size(); ++i) {
    acc += weights[i];
    if (r < acc) {
      return i;
    }
  }
  // Floating point rounding: last non-zero weight
  for (size_t i = weights.size(); i > 0; --i) {
    if (weights[i - 1] > 0.0) {
      return i - 1;
    }
  }
  return weights.size() - 1;
}

} // namespace evoguard::core
