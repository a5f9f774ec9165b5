#include "evoguard/core/error.h"
#include "evoguard/core/logger.h"
#include "evoguard/mutation/engine_config.h"
#include "evoguard/mutation/unified_mutation_operator.h"
#include "evoguard/sandbox/direct_executor.h"
#include "evoguard/sandbox/isolation_backend.h"
#include "evoguard/sandbox/sandbox_config.h"
#include "evoguard/sandbox/sandbox_execution_wrapper.h"
#include "evoguard/security/security_validator.h"
#include "evoguard/snippet/data_provider.h"
#include "evoguard/strategy/config_validator.h"
#include "evoguard/strategy/strategy.h"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace {

using namespace evoguard;

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

constexpr size_t kDemoBars = 504;

class UsageError {
public:
  explicit UsageError(kj::String message) : message_(kj::mv(message)) {}
  [[nodiscard]] kj::StringPtr message() const {
    return message_;
  }

private:
  kj::String message_;
};

void print_usage() {
  std::cerr << "usage: evoguard [--config <file.json>] <command> [options]\n"
               "\n"
               "commands:\n"
               "  validate <file>                       check a snippet or strategy JSON\n"
               "  mutate <file> [--param name] [--seed n] [--tier n]\n"
               "                                        mutate a strategy JSON once\n"
               "  execute <file> [--direct] [--timeout ms]\n"
               "                                        run a snippet and print its metrics\n"
               "  evolve [--generations n]              mutate and evaluate a built-in strategy\n";
}

struct Arguments {
  kj::Maybe<kj::StringPtr> config_path;
  kj::StringPtr command;
  kj::Vector<kj::StringPtr> positional;
  kj::Vector<kj::StringPtr> flags;
  kj::TreeMap<kj::StringPtr, kj::StringPtr> options;

  [[nodiscard]] bool has_flag(kj::StringPtr flag) const {
    for (auto f : flags) {
      if (f == flag) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] kj::Maybe<kj::StringPtr> option(kj::StringPtr name) const {
    KJ_IF_SOME(value, options.find(name)) {
      return value;
    }
    return kj::none;
  }

  [[nodiscard]] kj::StringPtr file() const {
    if (positional.size() != 1) {
      throw UsageError(kj::str(command, " expects exactly one file argument"));
    }
    return positional[0];
  }
};

[[nodiscard]] bool is_valued_option(kj::StringPtr arg) {
  return arg == "--config" || arg == "--param" || arg == "--seed" || arg == "--tier" ||
         arg == "--timeout" || arg == "--generations";
}

[[nodiscard]] Arguments parse_arguments(int argc, char** argv) {
  Arguments args;
  bool have_command = false;
  for (int i = 1; i < argc; ++i) {
    kj::StringPtr arg = argv[i];
    if (is_valued_option(arg)) {
      if (i + 1 >= argc) {
        throw UsageError(kj::str(arg, " requires a value"));
      }
      kj::StringPtr value = argv[++i];
      if (arg == "--config") {
        args.config_path = value;
      } else {
        args.options.upsert(arg, value);
      }
    } else if (arg.startsWith("--")) {
      args.flags.add(arg);
    } else if (!have_command) {
      args.command = arg;
      have_command = true;
    } else {
      args.positional.add(arg);
    }
  }
  if (!have_command) {
    throw UsageError(kj::str("missing command"));
  }
  return args;
}

[[nodiscard]] int64_t integer_option(const Arguments& args, kj::StringPtr name,
                                     int64_t fallback) {
  KJ_IF_SOME(text, args.option(name)) {
    KJ_IF_SOME(value, text.tryParseAs<int64_t>()) {
      return value;
    }
    throw UsageError(kj::str(name, " expects an integer, got '", text, "'"));
  }
  return fallback;
}

[[nodiscard]] kj::String read_text_file(kj::StringPtr path) {
  auto fs = kj::newDiskFilesystem();
  auto resolved = fs->getCurrentPath().eval(path);
  return fs->getRoot().openFile(resolved)->readAllText();
}

[[nodiscard]] mutation::EngineConfig load_engine_config(const Arguments& args) {
  KJ_IF_SOME(path, args.config_path) {
    return mutation::EngineConfig::from_file(path);
  }
  mutation::EngineConfig config;
  config.validate();
  return config;
}

[[nodiscard]] sandbox::SandboxConfig load_sandbox_config(const Arguments& args) {
  KJ_IF_SOME(path, args.config_path) {
    return sandbox::SandboxConfig::from_file(path);
  }
  return sandbox::SandboxConfig{};
}

void print_validation(const security::ValidationResult& result) {
  for (auto& warning : result.warnings) {
    std::cout << "warning: " << warning.cStr() << '\n';
  }
  for (auto& error : result.errors) {
    std::cout << "error: " << error.cStr() << '\n';
  }
  std::cout << (result.success ? "valid" : "invalid") << '\n';
}

int run_validate(const Arguments& args) {
  auto path = args.file();
  auto text = read_text_file(path);
  if (path.endsWith(".json")) {
    strategy::StrategyConfigValidator validator;
    auto result = validator.validate(text);
    if (result.success) {
      auto parsed = strategy::Strategy::from_config_json(text);
      result = parsed.validate();
      if (result.success) {
        result = security::SecurityValidator().validate(parsed.to_code());
      }
    }
    print_validation(result);
    return result.success ? kExitOk : kExitRejected;
  }
  auto result = security::SecurityValidator().validate(text);
  print_validation(result);
  return result.success ? kExitOk : kExitRejected;
}

int run_mutate(const Arguments& args) {
  auto config = load_engine_config(args);
  config.seed = static_cast<uint64_t>(integer_option(args, "--seed"_kj,
                                                     static_cast<int64_t>(config.seed)));
  auto input = strategy::Strategy::from_config_json(read_text_file(args.file()));

  mutation::MutationRequest request;
  KJ_IF_SOME(parameter, args.option("--param"_kj)) {
    request.mutation_type = mutation::kExitMutationType;
    request.exit_parameter = parameter;
  }
  if (args.option("--tier"_kj) != kj::none) {
    request.override_tier = static_cast<int>(integer_option(args, "--tier"_kj, 0));
  }

  mutation::UnifiedMutationOperator op(config);
  auto outcome = op.mutate(input, request);
  if (!outcome.success) {
    KJ_IF_SOME(error, outcome.error) {
      std::cerr << "mutation failed: " << error.cStr() << '\n';
    }
    std::cerr << "fallback chain: " << mutation::format_chain(outcome.fallback_chain).cStr()
              << '\n';
    return kExitRejected;
  }
  std::cerr << "mutation: " << outcome.mutation_type.cStr() << " (tier " << outcome.tier_used
            << ")\n";
  std::cout << outcome.strategy.to_config_json(true).cStr() << '\n';
  return kExitOk;
}

[[nodiscard]] kj::Own<sandbox::SandboxExecutionWrapper>
make_sandbox(sandbox::SandboxConfig config, const sandbox::DirectExecutor& direct) {
  kj::Maybe<kj::Own<sandbox::IsolationBackend>> backend;
  if (config.mode == sandbox::ExecutionMode::Isolated) {
    sandbox::IsolationLimits limits;
    limits.memory_limit_mb = config.memory_limit_mb;
    limits.cpu_limit_seconds = config.cpu_limit_seconds;
    backend = kj::heap<sandbox::ProcessIsolationBackend>(direct, limits);
  }
  return kj::heap<sandbox::SandboxExecutionWrapper>(config, direct, kj::mv(backend));
}

void print_metrics(const sandbox::Metrics& metrics) {
  for (auto& entry : metrics) {
    std::cout << entry.key.cStr() << ' ' << entry.value << '\n';
  }
}

int run_execute(const Arguments& args) {
  auto config = load_sandbox_config(args);
  if (args.has_flag("--direct"_kj)) {
    config.mode = sandbox::ExecutionMode::Direct;
  }
  config.timeout_ms = integer_option(args, "--timeout"_kj, config.timeout_ms);
  config.validate();

  auto code = read_text_file(args.file());
  auto verdict = security::SecurityValidator().validate(code);
  if (!verdict.success) {
    print_validation(verdict);
    return kExitRejected;
  }

  auto data = snippet::make_synthetic_ohlcv(kDemoBars, 7);
  sandbox::DirectExecutor direct(*data);
  auto wrapper = make_sandbox(kj::mv(config), direct);
  auto outcome = wrapper->execute(code);
  wrapper->shutdown();

  std::cerr << "isolated: " << (outcome.isolated ? "yes" : "no") << '\n';
  if (!outcome.success) {
    KJ_IF_SOME(error, outcome.error) {
      std::cerr << "execution failed: " << error.cStr() << '\n';
    }
    return kExitRejected;
  }
  print_metrics(outcome.metrics);
  return kExitOk;
}

/// Sharpe ratio of a successful run, none otherwise
[[nodiscard]] kj::Maybe<double> fitness_of(const sandbox::SandboxOutcome& outcome) {
  if (!outcome.success) {
    return kj::none;
  }
  KJ_IF_SOME(sharpe, outcome.metrics.find("sharpe_ratio"_kj)) {
    if (std::isfinite(sharpe)) {
      return sharpe;
    }
  }
  return kj::none;
}

int run_evolve(const Arguments& args) {
  auto config = load_engine_config(args);
  auto sandbox_config = load_sandbox_config(args);
  auto generations = integer_option(args, "--generations"_kj, 20);
  if (generations <= 0) {
    throw UsageError(kj::str("--generations must be positive"));
  }
  auto& logger = core::global_logger();

  auto data = snippet::make_synthetic_ohlcv(kDemoBars, config.seed);
  sandbox::DirectExecutor direct(*data);
  auto wrapper = make_sandbox(kj::mv(sandbox_config), direct);
  mutation::UnifiedMutationOperator op(config);

  auto best = strategy::make_default_strategy();
  auto baseline = wrapper->execute(best.to_code());
  auto baseline_fitness = fitness_of(baseline);
  auto best_fitness = KJ_UNWRAP_OR(baseline_fitness, {
    std::cerr << "baseline strategy failed to execute\n";
    return kExitRejected;
  });
  logger.info(kj::str("Baseline fitness: ", best_fitness));

  int stagnation = 0;
  for (int64_t generation = 0; generation < generations; ++generation) {
    mutation::MutationRequest request;
    request.generation = static_cast<int>(generation);
    request.stagnation = stagnation;
    request.diversity = 1.0 / (1.0 + stagnation);
    request.market_data = static_cast<const snippet::DataProvider&>(*data);

    auto outcome = op.mutate(best, request);
    if (!outcome.success) {
      ++stagnation;
      continue;
    }
    auto code = outcome.strategy.to_code();
    auto run = wrapper->execute(code);
    auto fitness = fitness_of(run);
    double candidate = -1e9;
    KJ_IF_SOME(f, fitness) {
      candidate = f;
    }
    double delta = candidate - best_fitness;
    KJ_IF_SOME(id, outcome.record_id) {
      op.record_performance(id, delta);
    }
    if (fitness != kj::none && delta > 0.0) {
      logger.info(kj::str("Generation ", generation, ": ", outcome.mutation_type,
                          " improved fitness ", best_fitness, " -> ", candidate));
      best = kj::mv(outcome.strategy);
      best_fitness = candidate;
      stagnation = 0;
    } else {
      ++stagnation;
    }
  }
  wrapper->shutdown();

  std::cout << "best_fitness " << best_fitness << '\n';
  std::cout << op.get_statistics().to_json(true).cStr() << '\n';
  std::cout << op.tracker().get_statistics(true).cStr() << '\n';
  std::cout << wrapper->get_statistics().to_json(true).cStr() << '\n';
  std::cout << best.to_config_json(true).cStr() << '\n';
  return kExitOk;
}

int dispatch(const Arguments& args) {
  if (args.command == "validate") {
    return run_validate(args);
  }
  if (args.command == "mutate") {
    return run_mutate(args);
  }
  if (args.command == "execute") {
    return run_execute(args);
  }
  if (args.command == "evolve") {
    return run_evolve(args);
  }
  throw UsageError(kj::str("unknown command '", args.command, "'"));
}

} // namespace

int main(int argc, char** argv) {
  int status = kExitUsage;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               try {
                 status = dispatch(parse_arguments(argc, argv));
               } catch (const UsageError& e) {
                 std::cerr << "evoguard: " << e.message().cStr() << "\n\n";
                 print_usage();
                 status = kExitUsage;
               } catch (const core::ConfigException& e) {
                 std::cerr << "configuration error: " << e.message().cStr() << '\n';
                 status = kExitUsage;
               } catch (const core::EvoGuardException& e) {
                 std::cerr << "error: " << e.message().cStr() << '\n';
                 status = kExitRejected;
               }
             })) {
    std::cerr << "error: " << exception.getDescription().cStr() << '\n';
    status = kExitRejected;
  }
  core::global_logger().flush();
  return status;
}
