#include "evoguard/core/error.h"
#include "evoguard/mutation/exit_parameter_mutator.h"
#include "evoguard/snippet/parser.h"
#include "kj/test.h"

#include <kj/debug.h>

using namespace evoguard::mutation;

namespace {

constexpr kj::StringPtr kExitBlock = "stop_loss_pct = 0.10\n"
                                     "take_profit_pct = 0.20\n"
                                     "trailing_stop_offset = 0.02\n"
                                     "holding_period_days = 20\n"_kj;

double value_in(kj::StringPtr code, kj::StringPtr name) {
  auto found = ExitParameterMutator::find_value(code, name);
  return KJ_ASSERT_NONNULL(found, name, code);
}

KJ_TEST("ExitParameterMutator: Stop loss stays within bounds") {
  ExitParameterMutator mutator(ExitMutationConfig(), 42);
  auto result = mutator.mutate("stop_loss_pct = 0.10"_kj, "stop_loss_pct"_kj);

  KJ_ASSERT(result.success);
  KJ_EXPECT(result.validation_passed);
  KJ_EXPECT(result.metadata.parameter_name == "stop_loss_pct");
  KJ_EXPECT(result.metadata.old_value == 0.10);
  KJ_EXPECT(result.metadata.new_value >= 0.01 && result.metadata.new_value <= 0.20,
            result.metadata.new_value);
  KJ_EXPECT(evoguard::snippet::check_syntax(result.mutated_code) == kj::none);
}

KJ_TEST("ExitParameterMutator: Random parameter choice mostly succeeds") {
  ExitParameterMutator mutator(ExitMutationConfig(), 7);
  size_t successes = 0;
  for (int i = 0; i < 100; ++i) {
    auto result = mutator.mutate(kExitBlock);
    if (result.success) {
      ++successes;
    }
  }
  KJ_EXPECT(successes >= 70, successes);

  auto stats = mutator.get_statistics();
  KJ_EXPECT(stats.total == 100);
  KJ_EXPECT(stats.success == successes);
  KJ_EXPECT(stats.success_rate() >= 0.7);
}

KJ_TEST("ExitParameterMutator: Every result respects its bounds") {
  ExitMutationConfig config;
  config.gaussian_std_dev = 2.0;
  ExitParameterMutator mutator(config, 3);
  for (int i = 0; i < 200; ++i) {
    auto result = mutator.mutate(kExitBlock);
    KJ_ASSERT(result.success);
    auto found = config.find_bounds(result.metadata.parameter_name);
    auto& bounds = KJ_ASSERT_NONNULL(found);
    double written = value_in(result.mutated_code, result.metadata.parameter_name);
    KJ_EXPECT(bounds.contains(written), result.metadata.parameter_name, written);
    KJ_EXPECT(bounds.contains(result.metadata.new_value));
  }
  // A wide spread must hit the bounds sometimes
  KJ_EXPECT(mutator.get_statistics().clamped > 0);
}

KJ_TEST("ExitParameterMutator: Integer parameter is written as an integer") {
  ExitParameterMutator mutator(ExitMutationConfig(), 11);
  for (int i = 0; i < 20; ++i) {
    auto result = mutator.mutate(kExitBlock, "holding_period_days"_kj);
    KJ_ASSERT(result.success);
    double written = value_in(result.mutated_code, "holding_period_days"_kj);
    KJ_EXPECT(written == static_cast<double>(static_cast<int64_t>(written)), written);
    KJ_EXPECT(!result.mutated_code.contains("holding_period_days = 20.0"_kj));
  }
}

KJ_TEST("ExitParameterMutator: Missing parameter leaves code unchanged") {
  ExitParameterMutator mutator;
  kj::StringPtr code = "x = 1\n"
                       "stop_loss_pct_max = 0.5\n"_kj;
  auto result = mutator.mutate(code, "stop_loss_pct"_kj);
  KJ_EXPECT(!result.success);
  KJ_EXPECT(result.mutated_code == code);
  KJ_EXPECT(result.error != kj::none);
  KJ_EXPECT(mutator.get_statistics().failed_regex == 1);

  auto unknown = mutator.mutate(kExitBlock, "position_size"_kj);
  KJ_EXPECT(!unknown.success);
  KJ_EXPECT(unknown.mutated_code == kExitBlock);
}

KJ_TEST("ExitParameterMutator: Only the first assignment is edited") {
  ExitParameterMutator mutator(ExitMutationConfig(), 5);
  auto result = mutator.mutate("# exit rules\n"
                               "stop_loss_pct = 0.10  # tight\n"
                               "stop_loss_pct = 0.15\n"_kj,
                               "stop_loss_pct"_kj);
  KJ_ASSERT(result.success);
  KJ_EXPECT(result.mutated_code.startsWith("# exit rules\nstop_loss_pct = "));
  KJ_EXPECT(result.mutated_code.contains("  # tight\nstop_loss_pct = 0.15\n"_kj),
            result.mutated_code);
}

KJ_TEST("ExitParameterMutator: Same seed gives the same mutations") {
  ExitParameterMutator a(ExitMutationConfig(), 99);
  ExitParameterMutator b(ExitMutationConfig(), 99);
  for (int i = 0; i < 10; ++i) {
    auto ra = a.mutate(kExitBlock);
    auto rb = b.mutate(kExitBlock);
    KJ_EXPECT(ra.mutated_code == rb.mutated_code);
    KJ_EXPECT(ra.metadata.parameter_name == rb.metadata.parameter_name);
  }
}

KJ_TEST("ExitParameterMutator: Helpers and statistics reset") {
  KJ_EXPECT(ExitParameterMutator::format_value(0.1234567, false) == "0.123457");
  KJ_EXPECT(ExitParameterMutator::format_value(14.6, true) == "15");
  KJ_EXPECT(value_in("take_profit_pct=.25\n"_kj, "take_profit_pct"_kj) == 0.25);
  KJ_EXPECT(ExitParameterMutator::find_value("x_stop_loss_pct = 1\n"_kj, "stop_loss_pct"_kj) ==
            kj::none);

  ExitParameterMutator mutator;
  auto result = mutator.mutate(kExitBlock);
  KJ_EXPECT(mutator.get_statistics().total == 1);
  mutator.reset_statistics();
  KJ_EXPECT(mutator.get_statistics().total == 0);
}

KJ_TEST("ExitParameterMutator: Invalid configuration is rejected") {
  ExitMutationConfig config;
  config.gaussian_std_dev = 0.0;
  bool caught = false;
  try {
    ExitParameterMutator mutator(config);
  } catch (const evoguard::core::ConfigException&) {
    caught = true;
  }
  KJ_EXPECT(caught);

  ExitMutationConfig inverted;
  inverted.bounds[0].min = 0.5;
  caught = false;
  try {
    ExitParameterMutator mutator(inverted);
  } catch (const evoguard::core::ConfigException& e) {
    caught = true;
    KJ_EXPECT(e.message().contains("stop_loss_pct"_kj));
  }
  KJ_EXPECT(caught);
}

} // namespace
