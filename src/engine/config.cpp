#include "ttl_cache/config.hpp"

#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace ttl_cache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::int64_t>(std::stoll(m[1].str()));
  return true;
}
// A leading minus still matches so that the caller can reject it.
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out, bool &negative) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  const auto digits = m[1].str();
  negative = digits.front() == '-';
  out = negative ? 0 : static_cast<std::uint64_t>(std::stoull(digits));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
} // namespace

bool load_config_file(const std::string &path, CacheConfig &out, Error *err) {
  std::ifstream in(path);
  if (!in.is_open())
    return fail(err, ErrorCode::InvalidConfig, "config file not found: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config_text(ss.str(), out, err);
}

bool parse_config_text(const std::string &text, CacheConfig &out, Error *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos)
    return fail(err, ErrorCode::InvalidConfig, "invalid schema");

  CacheConfig next = out;
  std::int64_t i;
  std::uint64_t u;
  bool negative = false;
  std::string s;
  try {
    if (extract_i64(text, "capacity", i)) {
      if (i < 0)
        return fail(err, ErrorCode::InvalidConfig,
                    "capacity cannot be negative: " + std::to_string(i));
      next.capacity = static_cast<std::size_t>(i);
    }
    if (extract_u64(text, "clearing_interval_ms", u, negative)) {
      if (negative)
        return fail(err, ErrorCode::InvalidConfig,
                    "clearing_interval_ms cannot be negative");
      if (u > static_cast<std::uint64_t>(
                  std::numeric_limits<Duration::rep>::max()))
        return fail(err, ErrorCode::InvalidConfig,
                    "clearing_interval_ms out of range: " + std::to_string(u));
      next.clearing_interval = Duration(static_cast<Duration::rep>(u));
    }
    if (extract_u64(text, "random_seed", u, negative)) {
      if (negative)
        return fail(err, ErrorCode::InvalidConfig,
                    "random_seed cannot be negative");
      next.random_seed = u;
    }
  } catch (const std::out_of_range &) {
    return fail(err, ErrorCode::InvalidConfig, "numeric field out of range");
  }
  if (extract_string(text, "eviction_policy", s)) {
    const auto policy = parse_eviction_policy(s);
    if (!policy)
      return fail(err, ErrorCode::InvalidConfig,
                  "unknown eviction policy: " + s);
    next.policy = *policy;
  }

  out = next;
  return true;
}

} // namespace ttl_cache
