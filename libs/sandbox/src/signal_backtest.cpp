#include "evoguard/sandbox/signal_backtest.h"

#include <cmath> // std::sqrt, std::pow, std::isnan
#include <kj/debug.h>
#include <kj/vector.h>

namespace evoguard::sandbox {

namespace {

constexpr double kTradingDays = 252.0;

bool is_long(double signal) {
  return !std::isnan(signal) && signal > 0.0;
}

double sharpe(kj::ArrayPtr<const double> returns) {
  if (returns.size() < 2) {
    return 0.0;
  }
  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());

  double variance = 0.0;
  for (double r : returns) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(returns.size());

  double std_dev = std::sqrt(variance);
  if (std_dev == 0.0) {
    return 0.0;
  }
  return mean / std_dev * std::sqrt(kTradingDays);
}

} // namespace

BacktestMetrics run_signal_backtest(kj::ArrayPtr<const double> close,
                                    kj::ArrayPtr<const double> signal, const ExitRules& rules) {
  KJ_REQUIRE(close.size() == signal.size(), "signal and price series differ in length",
             close.size(), signal.size());

  BacktestMetrics metrics;
  if (close.size() < 2) {
    return metrics;
  }

  kj::Vector<double> daily_returns(close.size() - 1);
  kj::Vector<double> trade_pnls;
  double equity = 1.0;
  double peak_equity = 1.0;
  size_t bars_in_position = 0;

  bool in_position = false;
  double entry_price = 0.0;
  double highest = 0.0;
  int bars_held = 0;

  auto close_trade = [&](double price) {
    trade_pnls.add(price / entry_price - 1.0);
    in_position = false;
  };

  for (size_t i = 1; i < close.size(); ++i) {
    double r = 0.0;
    if (in_position) {
      r = close[i - 1] > 0.0 ? close[i] / close[i - 1] - 1.0 : 0.0;
      ++bars_in_position;
      ++bars_held;
    }
    daily_returns.add(r);
    equity *= 1.0 + r;
    peak_equity = kj::max(peak_equity, equity);
    if (peak_equity > 0.0) {
      metrics.max_drawdown = kj::max(metrics.max_drawdown, (peak_equity - equity) / peak_equity);
    }

    if (in_position) {
      highest = kj::max(highest, close[i]);
      double pnl = close[i] / entry_price - 1.0;
      bool exit = !is_long(signal[i]) || pnl <= -rules.stop_loss_pct ||
                  pnl >= rules.take_profit_pct ||
                  close[i] <= highest * (1.0 - rules.trailing_stop_offset) ||
                  bars_held >= rules.holding_period_days;
      if (exit) {
        close_trade(close[i]);
      }
    } else if (is_long(signal[i]) && close[i] > 0.0 && i + 1 < close.size()) {
      in_position = true;
      entry_price = close[i];
      highest = close[i];
      bars_held = 0;
    }
  }
  if (in_position) {
    close_trade(close[close.size() - 1]);
  }

  double periods = static_cast<double>(close.size() - 1);
  metrics.total_return = equity - 1.0;
  metrics.annual_return = equity > 0.0 ? std::pow(equity, kTradingDays / periods) - 1.0 : -1.0;
  metrics.sharpe_ratio = sharpe(daily_returns.asPtr());
  metrics.trade_count = static_cast<int>(trade_pnls.size());
  if (!trade_pnls.empty()) {
    size_t wins = 0;
    for (double pnl : trade_pnls) {
      wins += pnl > 0.0 ? 1 : 0;
    }
    metrics.win_rate = static_cast<double>(wins) / static_cast<double>(trade_pnls.size());
  }
  metrics.exposure = static_cast<double>(bars_in_position) / periods;
  return metrics;
}

} // namespace evoguard::sandbox
