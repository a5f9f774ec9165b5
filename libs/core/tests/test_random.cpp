#include "evoguard/core/random.h"
#include "kj/test.h"

#include <cmath>

using namespace evoguard::core;

namespace {

KJ_TEST("Random: Same seed gives same sequence") {
  Random a(42);
  Random b(42);
  for (int i = 0; i < 50; ++i) {
    KJ_EXPECT(a.gaussian(0.0, 1.0) == b.gaussian(0.0, 1.0));
    KJ_EXPECT(a.uniform_index(10) == b.uniform_index(10));
  }
}

KJ_TEST("Random: Reseed restarts the sequence") {
  Random random(7);
  double first = random.uniform(0.0, 1.0);
  random.uniform(0.0, 1.0);
  random.reseed(7);
  KJ_EXPECT(random.uniform(0.0, 1.0) == first);
  KJ_EXPECT(random.seed() == 7);
}

KJ_TEST("Random: Uniform stays in range") {
  Random random(1);
  for (int i = 0; i < 1000; ++i) {
    double v = random.uniform(0.01, 0.2);
    KJ_EXPECT(v >= 0.01 && v <= 0.2);
    KJ_EXPECT(random.uniform_index(3) < 3);
  }
}

KJ_TEST("Random: Bernoulli extremes") {
  Random random(3);
  for (int i = 0; i < 100; ++i) {
    KJ_EXPECT(!random.bernoulli(0.0));
    KJ_EXPECT(random.bernoulli(1.0));
  }
}

KJ_TEST("Random: Weighted index respects zero weights") {
  Random random(5);
  const double weights[] = {0.0, 1.0, 0.0};
  for (int i = 0; i < 200; ++i) {
    KJ_EXPECT(random.weighted_index(kj::arrayPtr(weights, 3)) == 1);
  }
}

KJ_TEST("Random: Weighted index follows proportions") {
  Random random(11);
  const double weights[] = {0.2, 0.4, 0.2, 0.2};
  size_t counts[4] = {0, 0, 0, 0};
  constexpr int kDraws = 20000;
  for (int i = 0; i < kDraws; ++i) {
    counts[random.weighted_index(kj::arrayPtr(weights, 4))]++;
  }
  double share = static_cast<double>(counts[1]) / kDraws;
  KJ_EXPECT(std::abs(share - 0.4) < 0.03, share);
}

KJ_TEST("Random: All-zero weights fall back to uniform") {
  Random random(13);
  const double weights[] = {0.0, 0.0};
  bool seen[2] = {false, false};
  for (int i = 0; i < 200; ++i) {
    seen[random.weighted_index(kj::arrayPtr(weights, 2))] = true;
  }
  KJ_EXPECT(seen[0] && seen[1]);
}

KJ_TEST("Random: Gaussian sample moments") {
  Random random(17);
  constexpr int kDraws = 20000;
  double sum = 0.0;
  double sum_sq = 0.0;
  for (int i = 0; i < kDraws; ++i) {
    double v = random.gaussian(0.0, 0.15);
    sum += v;
    sum_sq += v * v;
  }
  double mean = sum / kDraws;
  double std_dev = std::sqrt(sum_sq / kDraws - mean * mean);
  KJ_EXPECT(std::abs(mean) < 0.01, mean);
  KJ_EXPECT(std::abs(std_dev - 0.15) < 0.01, std_dev);
}

} // namespace
