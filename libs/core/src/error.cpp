#include "evoguard/core/error.h"

#include <kj/common.h>
#include <kj/string.h>

namespace evoguard::core {

kj::String to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return kj::str("Success");
  case ErrorCode::UnknownError:
    return kj::str("Unknown Error");
  case ErrorCode::ParseError:
    return kj::str("Parse Error");
  case ErrorCode::ValidationError:
    return kj::str("Validation Error");
  case ErrorCode::PolicyViolation:
    return kj::str("Policy Violation");
  case ErrorCode::MutationFailure:
    return kj::str("Mutation Failure");
  case ErrorCode::TierExhaustion:
    return kj::str("Tier Exhaustion");
  case ErrorCode::IsolationFailure:
    return kj::str("Isolation Failure");
  case ErrorCode::TimeoutError:
    return kj::str("Timeout Error");
  case ErrorCode::ResourceError:
    return kj::str("Resource Error");
  case ErrorCode::ConfigurationError:
    return kj::str("Configuration Error");
  case ErrorCode::ExecutionError:
    return kj::str("Execution Error");
  }
  return kj::str("Invalid Error Code");
}

ErrorCode to_error_code(kj::StringPtr str) {
  if (str == "Success"_kj || str == "success"_kj) {
    return ErrorCode::Success;
  } else if (str == "Parse Error"_kj || str == "parse"_kj) {
    return ErrorCode::ParseError;
  } else if (str == "Validation Error"_kj || str == "validation"_kj) {
    return ErrorCode::ValidationError;
  } else if (str == "Policy Violation"_kj || str == "policy"_kj) {
    return ErrorCode::PolicyViolation;
  } else if (str == "Mutation Failure"_kj || str == "mutation"_kj) {
    return ErrorCode::MutationFailure;
  } else if (str == "Tier Exhaustion"_kj || str == "tier_exhaustion"_kj) {
    return ErrorCode::TierExhaustion;
  } else if (str == "Isolation Failure"_kj || str == "isolation"_kj) {
    return ErrorCode::IsolationFailure;
  } else if (str == "Timeout Error"_kj || str == "timeout"_kj) {
    return ErrorCode::TimeoutError;
  } else if (str == "Resource Error"_kj || str == "resource"_kj) {
    return ErrorCode::ResourceError;
  } else if (str == "Configuration Error"_kj || str == "configuration"_kj) {
    return ErrorCode::ConfigurationError;
  } else if (str == "Execution Error"_kj || str == "execution"_kj) {
    return ErrorCode::ExecutionError;
  }
  return ErrorCode::UnknownError;
}

} // namespace evoguard::core
