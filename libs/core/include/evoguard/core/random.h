#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/vector.h>
#include <random>

namespace evoguard::core {

/**
 * @brief Seedable random source shared by the mutators
 *
 * Two Random objects constructed with the same seed produce the same
 * sequence, which makes every mutation reproducible. Not thread-safe; each
 * worker owns its own instance.
 */
class Random final {
public:
  explicit Random(uint64_t seed) : seed_(seed), engine_(seed) {}

  /// Seeded from std::random_device
  static Random from_entropy();

  [[nodiscard]] uint64_t seed() const {
    return seed_;
  }

  void reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
  }

  double gaussian(double mean, double std_dev);
  double uniform(double lo, double hi);
  size_t uniform_index(size_t n);
  bool bernoulli(double p);

  /**
   * @brief Draw an index with probability proportional to weights[i]
   *
   * Falls back to a uniform draw when all weights are zero.
   */
  size_t weighted_index(kj::ArrayPtr<const double> weights);

  std::mt19937_64& engine() {
    return engine_;
  }

private:
  uint64_t seed_;
  std::mt19937_64 engine_;
};

} // namespace evoguard::core
