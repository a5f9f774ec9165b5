/**
 * @file sandbox_config.h
 * @brief Settings for SandboxExecutionWrapper, read from the "sandbox"
 * section of the engine configuration file
 */

#pragma once

#include "evoguard/core/json.h"

#include <cstdint>
#include <kj/string.h>

namespace evoguard::sandbox {

enum class ExecutionMode : uint8_t {
  Direct,
  Isolated,
};

[[nodiscard]] kj::StringPtr to_string(ExecutionMode mode);
/// "direct" or "isolated". @throws core::ConfigException
[[nodiscard]] ExecutionMode parse_execution_mode(kj::StringPtr text);

struct SandboxConfig {
  ExecutionMode mode = ExecutionMode::Isolated;
  int64_t timeout_ms = 120'000;
  uint64_t memory_limit_mb = 512;
  uint64_t cpu_limit_seconds = 60;

  /// @throws core::ConfigException
  void validate() const;

  /// Reads `root["sandbox"]`; a missing section keeps the defaults
  static SandboxConfig from_json(const core::JsonValue& root);
  static SandboxConfig from_json(kj::StringPtr json);
  static SandboxConfig from_file(kj::StringPtr path);
};

} // namespace evoguard::sandbox
