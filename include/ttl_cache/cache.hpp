#pragma once

#include "ttl_cache/config.hpp"
#include "ttl_cache/entry_table.hpp"
#include "ttl_cache/error.hpp"
#include "ttl_cache/policy.hpp"
#include "ttl_cache/recency_index.hpp"
#include "ttl_cache/sweeper.hpp"
#include "ttl_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ttl_cache {

struct CacheCounters {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

// Keys and values are printed in stats() and error messages when they
// support operator<<.
template <typename T> void write_printable(std::ostream &os, const T &v) {
  if constexpr (requires(std::ostream &s, const T &t) { s << t; })
    os << v;
  else
    os << "<unprintable>";
}

template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class Cache {
public:
  using Policy = IEvictionPolicy<K, V, Hash, KeyEqual>;

  explicit Cache(CacheConfig cfg)
      : Cache(cfg, make_policy<K, V, Hash, KeyEqual>(cfg.policy,
                                                     cfg.random_seed)) {}

  Cache(CacheConfig cfg, std::unique_ptr<Policy> policy)
      : cfg_(std::move(cfg)), policy_(std::move(policy)),
        sweeper_(cfg_.effective_clearing_interval(),
                 [this] { purge_expired(); }) {
    if (!policy_)
      throw std::invalid_argument("ttl_cache: eviction policy is null");
    cfg_.clearing_interval = cfg_.effective_clearing_interval();
    sweeper_.start();
  }

  ~Cache() { close(); }

  Cache(const Cache &) = delete;
  Cache &operator=(const Cache &) = delete;

  std::optional<V> get(const K &key, Error *err = nullptr) {
    std::unique_lock lock(mutex_);
    const auto *entry = table_.lookup(key);
    if (!entry) {
      ++counters_.misses;
      not_found(key, err);
      return std::nullopt;
    }
    const auto now = Clock::now();
    if (entry->expired(now)) {
      erase_locked(key);
      ++counters_.expirations;
      ++counters_.misses;
      not_found(key, err);
      return std::nullopt;
    }
    table_.touch(key, now);
    recency_.move_to_front(key);
    ++counters_.hits;
    return entry->value;
  }

  void set(const K &key, V value, Duration ttl = Duration::zero()) {
    const auto now = Clock::now();
    std::unique_lock lock(mutex_);
    if (cfg_.capacity > 0 && table_.size() >= cfg_.capacity)
      evict_one_locked();
    table_.insert(key, std::move(value), ttl, now);
    recency_.push_front(key);
  }

  bool del(const K &key, Error *err = nullptr) {
    std::unique_lock lock(mutex_);
    if (!erase_locked(key))
      return not_found(key, err);
    return true;
  }

  void clear() {
    std::unique_lock lock(mutex_);
    table_.clear();
    recency_.clear();
  }

  std::optional<std::vector<K>> keys(Error *err = nullptr) const {
    std::shared_lock lock(mutex_);
    if (table_.empty()) {
      fail(err, ErrorCode::EmptyCache, "no keys found");
      return std::nullopt;
    }
    return table_.all_keys();
  }

  std::vector<V> get_all() const {
    std::shared_lock lock(mutex_);
    return table_.all_values();
  }

  bool set_ttl(const K &key, Duration ttl, Error *err = nullptr) {
    std::unique_lock lock(mutex_);
    auto *entry = table_.lookup(key);
    if (!entry)
      return not_found(key, err);
    entry->ttl = ttl;
    return true;
  }

  std::optional<Duration> get_ttl(const K &key, Error *err = nullptr) const {
    std::shared_lock lock(mutex_);
    const auto *entry = table_.lookup(key);
    if (!entry) {
      not_found(key, err);
      return std::nullopt;
    }
    return entry->ttl;
  }

  std::optional<std::uint64_t> get_counter(const K &key,
                                           Error *err = nullptr) const {
    std::shared_lock lock(mutex_);
    const auto *entry = table_.lookup(key);
    if (!entry) {
      not_found(key, err);
      return std::nullopt;
    }
    return entry->access_count;
  }

  // Shrinking below the current size evicts nothing now; the next set
  // evicts one entry.
  bool set_capacity(std::int64_t capacity, Error *err = nullptr) {
    if (capacity < 0)
      return fail(err, ErrorCode::InvalidCapacity,
                  "capacity cannot be negative: " + std::to_string(capacity));
    std::unique_lock lock(mutex_);
    cfg_.capacity = static_cast<std::size_t>(capacity);
    return true;
  }

  std::size_t capacity() const {
    std::shared_lock lock(mutex_);
    return cfg_.capacity;
  }

  bool set_eviction_policy(int policy, Error *err = nullptr) {
    const auto kind = policy_from_int(policy);
    if (!kind)
      return fail(err, ErrorCode::InvalidPolicy,
                  "invalid eviction policy: " + std::to_string(policy) +
                      " (must be 0-3)");
    return set_eviction_policy(*kind, err);
  }

  bool set_eviction_policy(EvictionPolicy policy, Error *err = nullptr) {
    auto next = make_policy<K, V, Hash, KeyEqual>(policy, cfg_.random_seed);
    if (!next)
      return fail(err, ErrorCode::InvalidPolicy,
                  "invalid eviction policy: " +
                      std::to_string(static_cast<int>(policy)));
    std::unique_lock lock(mutex_);
    cfg_.policy = policy;
    policy_ = std::move(next);
    return true;
  }

  bool set_eviction_policy(std::string_view name, Error *err = nullptr) {
    const auto kind = parse_eviction_policy(name);
    if (!kind)
      return fail(err, ErrorCode::InvalidPolicy,
                  "invalid eviction policy: " + std::string(name));
    return set_eviction_policy(*kind, err);
  }

  std::string eviction_policy() const {
    std::shared_lock lock(mutex_);
    return policy_->name();
  }

  Duration clearing_interval() const { return sweeper_.interval(); }

  std::size_t size() const {
    std::shared_lock lock(mutex_);
    return table_.size();
  }

  CacheCounters counters() const {
    std::shared_lock lock(mutex_);
    return counters_;
  }

  // One full sweep; the background sweeper calls this on every tick.
  std::size_t purge_expired() {
    std::unique_lock lock(mutex_);
    const auto now = Clock::now();
    std::vector<K> expired;
    table_.for_each([&](const K &key, const typename Table::EntryType &e) {
      if (e.expired(now))
        expired.push_back(key);
    });
    for (const auto &key : expired)
      erase_locked(key);
    counters_.expirations += expired.size();
    return expired.size();
  }

  std::string stats() const {
    std::shared_lock lock(mutex_);
    std::ostringstream os;
    const auto count = table_.size();
    const double occupancy =
        cfg_.capacity > 0 ? static_cast<double>(count) * 100.0 /
                                static_cast<double>(cfg_.capacity)
                          : 0.0;
    os << "STATS\n";
    os << "Eviction Policy: " << policy_->name() << "\n";
    os << "Capacity: "
       << (cfg_.capacity > 0 ? std::to_string(cfg_.capacity) : "unlimited")
       << "\n";
    os << "Clearing Interval: " << format_duration(cfg_.clearing_interval)
       << "\n";
    os << "Items: " << count << "\n";
    os << "Occupancy: " << std::fixed << std::setprecision(2) << occupancy
       << "%\n";
    os << "Cache:\n";
    table_.for_each([&](const K &key, const typename Table::EntryType &e) {
      os << "  Key: ";
      write_printable(os, key);
      os << " Value: ";
      write_printable(os, e.value);
      os << " TTL: " << format_duration(e.ttl) << " Counter: "
         << e.access_count << " Last Used: " << format_time_point(e.last_access)
         << "\n";
    });
    return os.str();
  }

  // Stops background expiry only; lazy expiry in get() keeps working.
  void close() { sweeper_.stop(); }

  bool sweeper_running() const { return sweeper_.running(); }

  bool index_consistent() const {
    std::shared_lock lock(mutex_);
    if (table_.size() != recency_.size())
      return false;
    for (const auto &key : recency_.keys()) {
      if (!table_.contains(key))
        return false;
    }
    return true;
  }

private:
  using Table = EntryTable<K, V, Hash, KeyEqual>;

  bool erase_locked(const K &key) {
    recency_.remove(key);
    return table_.remove(key);
  }

  void evict_one_locked() {
    const auto victim = policy_->pick_victim(table_, recency_);
    if (victim && erase_locked(*victim))
      ++counters_.evictions;
  }

  static bool not_found(const K &key, Error *err) {
    if (!err)
      return false;
    std::ostringstream os;
    os << "cache not found for key: ";
    write_printable(os, key);
    return fail(err, ErrorCode::NotFound, os.str());
  }

  CacheConfig cfg_;
  std::unique_ptr<Policy> policy_;
  Table table_;
  RecencyIndex<K, Hash, KeyEqual> recency_;
  CacheCounters counters_;
  mutable std::shared_mutex mutex_;
  Sweeper sweeper_;
};

} // namespace ttl_cache
