#pragma once

#include "ttl_cache/error.hpp"
#include "ttl_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ttl_cache {

inline constexpr Duration kDefaultClearingInterval = std::chrono::seconds(100);

struct CacheConfig {
  std::size_t capacity{0}; // 0 = unlimited
  Duration clearing_interval{0};
  EvictionPolicy policy{EvictionPolicy::Lru};
  std::optional<std::uint64_t> random_seed;

  Duration effective_clearing_interval() const {
    return clearing_interval > Duration::zero() ? clearing_interval
                                                : kDefaultClearingInterval;
  }
};

// Reads a flat JSON object:
//   {"capacity":128,"clearing_interval_ms":5000,"eviction_policy":"lfu",
//    "random_seed":7}
// Absent fields keep the value already in `out`. On failure `out` is left
// untouched.
bool load_config_file(const std::string &path, CacheConfig &out,
                      Error *err = nullptr);
bool parse_config_text(const std::string &text, CacheConfig &out,
                       Error *err = nullptr);

} // namespace ttl_cache
