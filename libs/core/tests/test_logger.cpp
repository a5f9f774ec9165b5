#include "evoguard/core/logger.h"
#include "kj/test.h"

#include <kj/string.h>

using namespace evoguard::core;

namespace {

struct CapturingLogger {
  MemoryOutput* output;
  kj::Own<Logger> logger;

  explicit CapturingLogger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>()) {
    auto memory = kj::heap<MemoryOutput>();
    output = memory.get();
    logger = kj::heap<Logger>(kj::mv(formatter), kj::mv(memory));
  }
};

KJ_TEST("LogLevel: Names round trip") {
  KJ_EXPECT(to_string(LogLevel::Warn) == "WARN");
  KJ_EXPECT(to_string(LogLevel::Critical) == "CRITICAL");
  KJ_IF_SOME(level, parse_log_level("debug"_kj)) {
    KJ_EXPECT(level == LogLevel::Debug);
  }
  else {
    KJ_FAIL_EXPECT("debug should parse");
  }
  KJ_EXPECT(parse_log_level("loud"_kj) == kj::none);
}

KJ_TEST("Logger: Level filtering") {
  CapturingLogger capture;
  capture.logger->set_level(LogLevel::Warn);

  capture.logger->info("Clamped stop_loss_pct"_kj);
  capture.logger->warn("Tier 3 failed; trying tier 2"_kj);
  capture.logger->error("All fallback tiers failed"_kj);

  KJ_EXPECT(capture.output->size() == 2);
  KJ_EXPECT(!capture.output->contains("Clamped"_kj));
  KJ_EXPECT(capture.output->contains("[WARN]"_kj));
  KJ_EXPECT(capture.output->contains("[ERROR]"_kj));
}

KJ_TEST("TextFormatter: Includes level file and message") {
  CapturingLogger capture;
  capture.logger->info(kj::str("Loaded configuration from ", "evoguard.json"));

  auto lines = capture.output->lines();
  KJ_ASSERT(lines.size() == 1);
  KJ_EXPECT(lines[0].contains("[INFO]"_kj));
  KJ_EXPECT(lines[0].contains("test_logger.cpp"_kj));
  KJ_EXPECT(lines[0].contains("Loaded configuration from evoguard.json"_kj));
}

KJ_TEST("JsonFormatter: Escapes message") {
  CapturingLogger capture(kj::heap<JsonFormatter>());
  capture.logger->warn("quote \" and newline\n"_kj);

  auto lines = capture.output->lines();
  KJ_ASSERT(lines.size() == 1);
  KJ_EXPECT(lines[0].contains("\"level\""_kj));
  KJ_EXPECT(lines[0].contains("\\\""_kj));
  KJ_EXPECT(lines[0].contains("\\n"_kj));
}

KJ_TEST("MultiOutput: Fans out to every destination") {
  auto first = kj::heap<MemoryOutput>();
  auto second = kj::heap<MemoryOutput>();
  auto& first_ref = *first;
  auto& second_ref = *second;

  Logger logger(kj::heap<TextFormatter>(), kj::mv(first));
  logger.add_output(kj::mv(second));
  logger.info("sandbox fallback"_kj);

  KJ_EXPECT(first_ref.size() == 1);
  KJ_EXPECT(second_ref.size() == 1);
}

KJ_TEST("MemoryOutput: Clear") {
  CapturingLogger capture;
  capture.logger->info("one"_kj);
  capture.output->clear();
  KJ_EXPECT(capture.output->size() == 0);
}

} // namespace
