#include "evoguard/sandbox/sandbox_config.h"

#include "evoguard/core/error.h"

#include <cmath>
#include <kj/debug.h>

namespace evoguard::sandbox {

namespace {

int64_t read_positive(const core::JsonValue& section, kj::StringPtr key, int64_t current) {
  auto value = section[key];
  if (!value.is_valid() || value.is_null()) {
    return current;
  }
  if (!value.is_number() || std::floor(value.get_double()) != value.get_double()) {
    throw core::ConfigException(kj::str("sandbox.", key, " must be an integer"));
  }
  return static_cast<int64_t>(value.get_double());
}

} // namespace

kj::StringPtr to_string(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::Direct:
    return "direct"_kj;
  case ExecutionMode::Isolated:
    return "isolated"_kj;
  }
  KJ_UNREACHABLE;
}

ExecutionMode parse_execution_mode(kj::StringPtr text) {
  if (text == "direct"_kj) {
    return ExecutionMode::Direct;
  }
  if (text == "isolated"_kj) {
    return ExecutionMode::Isolated;
  }
  throw core::ConfigException(
      kj::str("sandbox.mode must be 'direct' or 'isolated', got '", text, "'"));
}

void SandboxConfig::validate() const {
  if (timeout_ms <= 0) {
    throw core::ConfigException(kj::str("sandbox.timeout_ms must be positive, got ", timeout_ms));
  }
  if (memory_limit_mb == 0) {
    throw core::ConfigException("sandbox.memory_limit_mb must be positive"_kj);
  }
  if (cpu_limit_seconds == 0) {
    throw core::ConfigException("sandbox.cpu_limit_seconds must be positive"_kj);
  }
}

SandboxConfig SandboxConfig::from_json(const core::JsonValue& root) {
  SandboxConfig config;
  auto section = root["sandbox"];
  if (!section.is_valid() || section.is_null()) {
    return config;
  }
  if (!section.is_object()) {
    throw core::ConfigException("sandbox section must be a JSON object"_kj);
  }

  auto mode = section["mode"];
  if (mode.is_valid() && !mode.is_null()) {
    KJ_IF_SOME(text, mode.get_string_ptr()) {
      config.mode = parse_execution_mode(text);
    } else {
      throw core::ConfigException("sandbox.mode must be a string"_kj);
    }
  }
  config.timeout_ms = read_positive(section, "timeout_ms"_kj, config.timeout_ms);
  int64_t memory = read_positive(section, "memory_limit_mb"_kj,
                                 static_cast<int64_t>(config.memory_limit_mb));
  int64_t cpu = read_positive(section, "cpu_limit_seconds"_kj,
                              static_cast<int64_t>(config.cpu_limit_seconds));
  if (memory < 0 || cpu < 0) {
    throw core::ConfigException("sandbox limits must not be negative"_kj);
  }
  config.memory_limit_mb = static_cast<uint64_t>(memory);
  config.cpu_limit_seconds = static_cast<uint64_t>(cpu);

  config.validate();
  return config;
}

SandboxConfig SandboxConfig::from_json(kj::StringPtr json) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse(json); })) {
    throw core::ConfigException(
        kj::str("Invalid configuration JSON: ", exception.getDescription()));
  }
  return from_json(doc.root());
}

SandboxConfig SandboxConfig::from_file(kj::StringPtr path) {
  core::JsonDocument doc;
  KJ_IF_SOME(exception,
             kj::runCatchingExceptions([&]() { doc = core::JsonDocument::parse_file(path); })) {
    throw core::ConfigException(
        kj::str("Cannot load configuration ", path, ": ", exception.getDescription()));
  }
  return from_json(doc.root());
}

} // namespace evoguard::sandbox
