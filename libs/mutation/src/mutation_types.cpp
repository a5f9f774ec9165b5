#include "evoguard/mutation/mutation_types.h"

#include <kj/debug.h>

namespace evoguard::mutation {

kj::Maybe<Tier> tier_from_number(int number) {
  switch (number) {
  case 1:
    return Tier::Config;
  case 2:
    return Tier::Domain;
  case 3:
    return Tier::Ast;
  default:
    return kj::none;
  }
}

kj::StringPtr to_string(Tier tier) {
  switch (tier) {
  case Tier::Config:
    return "Tier 1 (Config)"_kj;
  case Tier::Domain:
    return "Tier 2 (Domain)"_kj;
  case Tier::Ast:
    return "Tier 3 (AST)"_kj;
  }
  KJ_UNREACHABLE;
}

void set_metadata(Metadata& metadata, kj::StringPtr key, kj::String value) {
  metadata.upsert(kj::str(key), kj::mv(value),
                  [](kj::String& existing, kj::String&& replacement) {
                    existing = kj::mv(replacement);
                  });
}

Metadata clone_metadata(const Metadata& metadata) {
  Metadata copy;
  for (auto& entry : metadata) {
    copy.insert(kj::str(entry.key), kj::str(entry.value));
  }
  return copy;
}

kj::String format_chain(kj::ArrayPtr<const int> chain) {
  kj::Vector<kj::String> parts;
  for (int tier : chain) {
    parts.add(kj::str(tier));
  }
  return kj::str("[", kj::strArray(parts, ", "), "]");
}

} // namespace evoguard::mutation
