#include "evoguard/core/json.h"
#include "kj/test.h"

#include <kj/string.h>

using namespace evoguard::core;

namespace {

KJ_TEST("JSON: Parse nested config section") {
  auto doc = JsonDocument::parse(R"({
        "seed": 42,
        "exit_mutation": {
          "gaussian_std_dev": 0.25,
          "bounds": { "stop_loss_pct": { "min": 0.01, "max": 0.2 } }
        }
      })"_kj);
  auto root = doc.root();

  KJ_EXPECT(root.is_object());
  KJ_EXPECT(root["seed"].get_int() == 42);
  KJ_EXPECT(root["exit_mutation"]["gaussian_std_dev"].get_double() == 0.25);
  KJ_EXPECT(root["exit_mutation"]["bounds"]["stop_loss_pct"]["max"].get_double() == 0.2);
}

KJ_TEST("JSON: Missing keys fall back to defaults") {
  auto doc = JsonDocument::parse(R"({"mutation": {}})"_kj);
  auto root = doc.root();

  KJ_EXPECT(!root["scheduler"].is_valid());
  KJ_EXPECT(root["scheduler"]["max_generations"].get_int(100) == 100);
  KJ_EXPECT(root["mutation"]["enable_fallback"].get_bool(true));
  KJ_EXPECT(root["mutation"]["probabilities"]["tier2"].get_double(0.4) == 0.4);
  KJ_EXPECT(root.get("missing"_kj) == kj::none);
}

KJ_TEST("JSON: Wrong types yield defaults and none") {
  auto doc = JsonDocument::parse(R"({"seed": "abc", "flag": 1})"_kj);
  auto root = doc.root();

  KJ_EXPECT(root["seed"].get_int(7) == 7);
  KJ_EXPECT(root["seed"].parse_as<int64_t>() == kj::none);
  KJ_EXPECT(root["flag"].parse_as<bool>() == kj::none);
  KJ_IF_SOME(text, root["seed"].get_string_ptr()) {
    KJ_EXPECT(text == "abc");
  }
  else {
    KJ_FAIL_EXPECT("seed should be a string");
  }
}

KJ_TEST("JSON: Parse error carries a description") {
  auto exception = kj::runCatchingExceptions([]() {
    auto doc = JsonDocument::parse(R"({"seed": 42,)"_kj);
    (void)doc;
  });
  KJ_IF_SOME(e, exception) {
    KJ_EXPECT(e.getDescription().size() > 0);
  }
  else {
    KJ_FAIL_EXPECT("malformed JSON should throw");
  }
}

KJ_TEST("JSON: Object iteration preserves order") {
  auto doc = JsonDocument::parse(R"({"tier1": 0.2, "tier2": 0.4, "tier3": 0.2})"_kj);
  kj::Vector<kj::String> seen;
  double sum = 0.0;
  doc.root().for_each_object([&](kj::StringPtr key, const JsonValue& value) {
    seen.add(kj::str(key));
    sum += value.get_double();
  });

  KJ_ASSERT(seen.size() == 3);
  KJ_EXPECT(seen[0] == "tier1");
  KJ_EXPECT(seen[2] == "tier3");
  KJ_EXPECT(sum > 0.79 && sum < 0.81);
}

KJ_TEST("JSON: Builder output parses back") {
  auto builder = JsonBuilder::object();
  builder.put("tier", 2)
      .put("success", true)
      .put("risk_score", 0.5)
      .put("mutation_type", "add_factor"_kj)
      .put("error", nullptr)
      .put_array("fallback_chain", [](JsonBuilder& chain) {
        chain.add(3).add(2).add(1);
      })
      .put_object("metadata", [](JsonBuilder& meta) {
        meta.put("parameter_name", "stop_loss_pct"_kj);
      });
  auto text = builder.build();

  auto doc = JsonDocument::parse(text);
  auto root = doc.root();
  KJ_EXPECT(root["tier"].get_int() == 2);
  KJ_EXPECT(root["success"].get_bool());
  KJ_EXPECT(root["risk_score"].get_double() == 0.5);
  KJ_EXPECT(root["mutation_type"].get_string() == "add_factor");
  KJ_EXPECT(root["error"].is_null());
  KJ_EXPECT(root["fallback_chain"].size() == 3);
  KJ_EXPECT(root["fallback_chain"][0].get_int() == 3);
  KJ_EXPECT(root["metadata"]["parameter_name"].get_string() == "stop_loss_pct");
}

KJ_TEST("JSON: Pretty output spans several lines") {
  auto builder = JsonBuilder::object();
  builder.put("a", 1).put("b", 2);
  auto compact = builder.build(false);
  auto pretty = builder.build(true);

  KJ_EXPECT(compact.findFirst('\n') == kj::none);
  KJ_EXPECT(pretty.findFirst('\n') != kj::none);
}

} // namespace
