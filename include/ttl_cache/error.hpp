#pragma once

#include <string>

namespace ttl_cache {

enum class ErrorCode {
  NotFound,
  EmptyCache,
  InvalidCapacity,
  InvalidPolicy,
  InvalidConfig
};

struct Error {
  ErrorCode code{ErrorCode::NotFound};
  std::string message;
};

const char *error_code_name(ErrorCode code);

// No-op when err is null. Always returns false so callers can
// `return fail(err, ...)` from bool functions.
bool fail(Error *err, ErrorCode code, std::string message);

} // namespace ttl_cache
