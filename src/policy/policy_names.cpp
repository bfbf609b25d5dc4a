#include "ttl_cache/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ttl_cache {

const char *policy_name(EvictionPolicy policy) {
  switch (policy) {
  case EvictionPolicy::Lru:
    return "LRU";
  case EvictionPolicy::Mru:
    return "MRU";
  case EvictionPolicy::Lfu:
    return "LFU";
  case EvictionPolicy::Random:
    return "RANDOM";
  }
  return "UNKNOWN";
}

std::optional<EvictionPolicy> policy_from_int(int value) {
  if (value < static_cast<int>(EvictionPolicy::Lru) ||
      value > static_cast<int>(EvictionPolicy::Random))
    return std::nullopt;
  return static_cast<EvictionPolicy>(value);
}

std::optional<EvictionPolicy> parse_eviction_policy(std::string_view name) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (s == "LRU")
    return EvictionPolicy::Lru;
  if (s == "MRU")
    return EvictionPolicy::Mru;
  if (s == "LFU")
    return EvictionPolicy::Lfu;
  if (s == "RANDOM")
    return EvictionPolicy::Random;
  return std::nullopt;
}

} // namespace ttl_cache
