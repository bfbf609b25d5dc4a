#include "ttl_cache/error.hpp"

#include <utility>

namespace ttl_cache {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::EmptyCache:
    return "empty_cache";
  case ErrorCode::InvalidCapacity:
    return "invalid_capacity";
  case ErrorCode::InvalidPolicy:
    return "invalid_policy";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  }
  return "unknown";
}

bool fail(Error *err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

} // namespace ttl_cache
