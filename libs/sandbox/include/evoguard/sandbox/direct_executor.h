/**
 * @file direct_executor.h
 * @brief In-process execution of a validated snippet
 *
 * The snippet runs in the interpreter against an explicit DataProvider. If
 * it defines `strategy(data, params)`, the returned series (or scalar) is
 * used as a position signal for run_signal_backtest() over the `close`
 * column, with the exit rules read from the snippet's top-level
 * assignments. Every numeric top-level global is also reported as
 * `var.<name>`.
 */

#pragma once

#include "evoguard/sandbox/signal_backtest.h"
#include "evoguard/snippet/data_provider.h"
#include "evoguard/snippet/interpreter.h"

#include <kj/map.h>
#include <kj/string.h>

namespace evoguard::sandbox {

using Metrics = kj::TreeMap<kj::String, double>;

[[nodiscard]] Metrics clone_metrics(const Metrics& metrics);

/**
 * @brief What one execution produced, on either path
 *
 * `success` is false when the snippet itself failed (parse or runtime
 * error); isolation problems are reported by exceptions instead.
 */
struct ExecutionReport {
  bool success = false;
  Metrics metrics;
  kj::Maybe<kj::String> error;

  [[nodiscard]] ExecutionReport clone() const;
};

class DirectExecutor {
public:
  explicit DirectExecutor(const snippet::DataProvider& data, snippet::ParamMap params = {},
                          snippet::ExecutionLimits limits = {});

  KJ_DISALLOW_COPY_AND_MOVE(DirectExecutor);

  /// Never throws for snippet errors; they come back as `success = false`
  [[nodiscard]] ExecutionReport run(kj::StringPtr code) const;

  /// Top-level exit assignments of a finished run, defaults for absent ones
  [[nodiscard]] static ExitRules read_exit_rules(const snippet::Interpreter& interpreter);

private:
  Metrics execute(kj::StringPtr code) const;

  const snippet::DataProvider& data_;
  snippet::ParamMap params_;
  snippet::ExecutionLimits limits_;
};

} // namespace evoguard::sandbox
