/**
 * @file signal_backtest.h
 * @brief One-asset long/flat backtest of a position signal with exit rules
 */

#pragma once

#include <kj/array.h>
#include <kj/common.h>

namespace evoguard::sandbox {

/// Values of the exit block; snippets that omit one keep these defaults
struct ExitRules {
  double stop_loss_pct = 0.10;
  double take_profit_pct = 0.20;
  double trailing_stop_offset = 0.02;
  int holding_period_days = 20;
};

struct BacktestMetrics {
  double total_return = 0.0;
  double annual_return = 0.0;
  double sharpe_ratio = 0.0;
  double max_drawdown = 0.0;
  double win_rate = 0.0;
  int trade_count = 0;
  /// Fraction of bars spent in a position
  double exposure = 0.0;
};

/**
 * @brief Run the signal over `close`
 *
 * A position opens at the close of a bar whose signal is positive and earns
 * from the next bar on. It closes at the first bar where the signal turns
 * non-positive or NaN, or an exit rule fires: loss beyond stop_loss_pct,
 * gain beyond take_profit_pct, a fall of trailing_stop_offset from the
 * highest close since entry, or holding_period_days bars held. An open
 * position is closed at the last bar.
 *
 * `signal` must be as long as `close`.
 */
[[nodiscard]] BacktestMetrics run_signal_backtest(kj::ArrayPtr<const double> close,
                                                  kj::ArrayPtr<const double> signal,
                                                  const ExitRules& rules = ExitRules());

} // namespace evoguard::sandbox
