#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ttl_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Integer values are part of the public contract: set_eviction_policy(int)
// accepts exactly 0..3.
enum class EvictionPolicy { Lru = 0, Mru = 1, Lfu = 2, Random = 3 };

template <typename V> struct Entry {
  V value;
  Duration ttl{0}; // zero never expires
  std::uint64_t access_count{1};
  TimePoint last_access{};

  // Compared in the ttl's own unit; last_access + ttl would overflow the
  // clock's nanosecond rep for very long ttls.
  bool expired(TimePoint now) const {
    return ttl != Duration::zero() &&
           std::chrono::duration_cast<Duration>(now - last_access) > ttl;
  }
};

const char *policy_name(EvictionPolicy policy);
std::optional<EvictionPolicy> policy_from_int(int value);
std::optional<EvictionPolicy> parse_eviction_policy(std::string_view name);

std::string format_duration(Duration d);
std::string format_time_point(TimePoint tp);

} // namespace ttl_cache
