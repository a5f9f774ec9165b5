#include "evoguard/mutation/risk_assessor.h"

#include "evoguard/core/error.h"

#include <algorithm>
#include <cmath>
#include <kj/debug.h>
#include <limits>

namespace evoguard::mutation {

namespace {

size_t line_count(kj::StringPtr text) {
  size_t lines = 1;
  for (char c : text) {
    if (c == '\n') {
      ++lines;
    }
  }
  return lines;
}

// Sample std (n - 1) of one-step percentage changes; NaN below two returns.
double return_volatility(kj::ArrayPtr<const double> prices) {
  kj::Vector<double> returns;
  for (size_t i = 1; i < prices.size(); ++i) {
    if (prices[i - 1] != 0.0 && std::isfinite(prices[i]) && std::isfinite(prices[i - 1])) {
      returns.add(prices[i] / prices[i - 1] - 1.0);
    }
  }
  if (returns.size() < 2) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());
  double sum_sq = 0.0;
  for (double r : returns) {
    sum_sq += (r - mean) * (r - mean);
  }
  return std::sqrt(sum_sq / static_cast<double>(returns.size() - 1));
}

// Trailing mean over at most `window` values, defined from the first value on.
kj::Array<double> trailing_mean(kj::ArrayPtr<const double> values, size_t window) {
  auto out = kj::heapArray<double>(values.size());
  double sum = 0.0;
  for (size_t i = 0; i < values.size(); ++i) {
    sum += values[i];
    if (i >= window) {
      sum -= values[i - window];
    }
    out[i] = sum / static_cast<double>(std::min(i + 1, window));
  }
  return out;
}

} // namespace

RiskAssessor::RiskAssessor(const RiskWeights& weights) : weights_(weights) {
  double total = weights_.strategy + weights_.market + weights_.mutation;
  if (std::fabs(total - 1.0) > 0.01) {
    throw core::ConfigException(kj::str("Weights must sum to 1.0, got ", total));
  }
}

size_t RiskAssessor::dependency_depth(const strategy::Strategy& strategy) {
  auto factors = strategy.factors();
  if (factors.size() == 0) {
    return 0;
  }
  kj::Array<size_t> order;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { order = strategy.dependency_order(); })) {
    // Cyclic graphs have no longest path; count every node instead.
    (void)exception;
    return factors.size();
  }

  auto depth = kj::heapArray<size_t>(factors.size());
  for (auto& d : depth) {
    d = 0;
  }
  size_t longest = 0;
  for (size_t index : order) {
    for (auto& dep : factors[index].depends_on) {
      for (size_t j = 0; j < factors.size(); ++j) {
        if (factors[j].id == dep) {
          depth[index] = std::max(depth[index], depth[j] + 1);
        }
      }
    }
    longest = std::max(longest, depth[index]);
  }
  return longest;
}

double RiskAssessor::assess_strategy_risk(const strategy::Strategy& strategy) const {
  size_t lines = 0;
  for (auto& factor : strategy.factors()) {
    lines += line_count(factor.logic);
  }
  double depth_score = std::min(static_cast<double>(dependency_depth(strategy)) / 10.0, 1.0);
  double count_score = std::min(static_cast<double>(strategy.factors().size()) / 20.0, 1.0);
  double complexity_score = std::min(static_cast<double>(lines) / 300.0, 1.0);
  return (depth_score + count_score + complexity_score) / 3.0;
}

double RiskAssessor::regime_changes(kj::ArrayPtr<const double> prices) {
  size_t n = prices.size();
  if (n < 10) {
    return 0.0;
  }
  auto short_ma = trailing_mean(prices, std::min<size_t>(5, n / 2));
  auto long_ma = trailing_mean(prices, std::min<size_t>(20, n - 1));
  double changes = 0.0;
  bool previous = short_ma[0] > long_ma[0];
  for (size_t i = 1; i < n; ++i) {
    bool current = short_ma[i] > long_ma[i];
    if (current != previous) {
      changes += 1.0;
    }
    previous = current;
  }
  return changes;
}

double RiskAssessor::drawdown_score(kj::ArrayPtr<const double> prices) {
  if (prices.size() < 2) {
    return 0.0;
  }
  double peak = prices[0];
  double max_drawdown = 0.0;
  for (double p : prices) {
    peak = std::max(peak, p);
    if (peak > 0.0) {
      max_drawdown = std::max(max_drawdown, (peak - p) / peak);
    }
  }
  double score = std::min(max_drawdown / 0.20, 1.0);
  return std::isnan(score) ? 0.0 : score;
}

double RiskAssessor::assess_market_risk(const snippet::DataProvider& data) const {
  if (data.length() == 0) {
    return 0.5;
  }
  kj::ArrayPtr<const double> close;
  KJ_IF_SOME(column, data.column("close"_kj)) {
    close = column;
  } else {
    return 0.5;
  }

  double volatility = return_volatility(close);
  double volatility_score = std::isnan(volatility) ? 0.5 : std::min(volatility / 0.05, 1.0);
  double regime_score = std::min(regime_changes(close) / 8.0, 1.0);
  return (volatility_score + regime_score + drawdown_score(close)) / 3.0;
}

double RiskAssessor::assess_mutation_risk(kj::ArrayPtr<const TierAttemptCounts> history) const {
  if (history.size() == 0) {
    return 0.5;
  }
  double total = 0.0;
  for (auto& tier : history) {
    if (tier.attempts == 0) {
      total += 0.5;
    } else {
      total += 1.0 - static_cast<double>(tier.successes) / static_cast<double>(tier.attempts);
    }
  }
  return total / static_cast<double>(history.size());
}

RiskMetrics
RiskAssessor::assess_overall_risk(const strategy::Strategy& strategy,
                                  kj::Maybe<const snippet::DataProvider&> market_data,
                                  kj::Maybe<kj::ArrayPtr<const TierAttemptCounts>> history) const {
  RiskMetrics metrics{};
  metrics.strategy_risk = assess_strategy_risk(strategy);
  metrics.market_risk = 0.5;
  metrics.mutation_risk = 0.5;
  KJ_IF_SOME(data, market_data) {
    metrics.market_risk = assess_market_risk(data);
    metrics.has_market_data = data.length() > 0;
  }
  KJ_IF_SOME(h, history) {
    metrics.mutation_risk = assess_mutation_risk(h);
    metrics.has_history = true;
  }
  metrics.overall_risk = metrics.strategy_risk * weights_.strategy +
                         metrics.market_risk * weights_.market +
                         metrics.mutation_risk * weights_.mutation;
  metrics.dag_depth = dependency_depth(strategy);
  metrics.factor_count = strategy.factors().size();
  return metrics;
}

} // namespace evoguard::mutation
