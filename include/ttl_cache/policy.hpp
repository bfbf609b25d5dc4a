#pragma once

#include "ttl_cache/entry_table.hpp"
#include "ttl_cache/recency_index.hpp"
#include "ttl_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace ttl_cache {

template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class IEvictionPolicy {
public:
  using Table = EntryTable<K, V, Hash, KeyEqual>;
  using Recency = RecencyIndex<K, Hash, KeyEqual>;

  virtual ~IEvictionPolicy() = default;
  virtual EvictionPolicy kind() const = 0;
  virtual std::string name() const { return policy_name(kind()); }
  // Called with the table at or above capacity, before a new key goes in.
  // nullopt means nothing can be evicted.
  virtual std::optional<K> pick_victim(const Table &entries,
                                       const Recency &recency) = 0;
};

namespace policies {

template <typename K, typename V, typename Hash, typename KeyEqual>
class LruPolicy final : public IEvictionPolicy<K, V, Hash, KeyEqual> {
  using Base = IEvictionPolicy<K, V, Hash, KeyEqual>;

public:
  EvictionPolicy kind() const override { return EvictionPolicy::Lru; }
  std::optional<K> pick_victim(const typename Base::Table &,
                               const typename Base::Recency &recency) override {
    return recency.back();
  }
};

template <typename K, typename V, typename Hash, typename KeyEqual>
class MruPolicy final : public IEvictionPolicy<K, V, Hash, KeyEqual> {
  using Base = IEvictionPolicy<K, V, Hash, KeyEqual>;

public:
  EvictionPolicy kind() const override { return EvictionPolicy::Mru; }
  std::optional<K> pick_victim(const typename Base::Table &,
                               const typename Base::Recency &recency) override {
    return recency.front();
  }
};

template <typename K, typename V, typename Hash, typename KeyEqual>
class LfuPolicy final : public IEvictionPolicy<K, V, Hash, KeyEqual> {
  using Base = IEvictionPolicy<K, V, Hash, KeyEqual>;

public:
  EvictionPolicy kind() const override { return EvictionPolicy::Lfu; }
  std::optional<K> pick_victim(const typename Base::Table &entries,
                               const typename Base::Recency &) override {
    if (entries.empty())
      return std::nullopt;
    // Strict less-than keeps the first minimum in the table's dense order.
    std::size_t victim = 0;
    std::uint64_t min_count = entries.lookup(entries.key_at(0))->access_count;
    for (std::size_t i = 1; i < entries.size(); ++i) {
      const auto count = entries.lookup(entries.key_at(i))->access_count;
      if (count < min_count) {
        min_count = count;
        victim = i;
      }
    }
    return entries.key_at(victim);
  }
};

template <typename K, typename V, typename Hash, typename KeyEqual>
class RandomPolicy final : public IEvictionPolicy<K, V, Hash, KeyEqual> {
  using Base = IEvictionPolicy<K, V, Hash, KeyEqual>;

public:
  explicit RandomPolicy(std::optional<std::uint64_t> seed)
      : rng_(seed.has_value() ? *seed : std::random_device{}()) {}

  EvictionPolicy kind() const override { return EvictionPolicy::Random; }
  std::optional<K> pick_victim(const typename Base::Table &entries,
                               const typename Base::Recency &) override {
    if (entries.empty())
      return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0, entries.size() - 1);
    return entries.key_at(pick(rng_));
  }

private:
  std::mt19937_64 rng_;
};

} // namespace policies

// Returns nullptr only for values outside the enum.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
std::unique_ptr<IEvictionPolicy<K, V, Hash, KeyEqual>>
make_policy(EvictionPolicy policy,
            std::optional<std::uint64_t> seed = std::nullopt) {
  switch (policy) {
  case EvictionPolicy::Lru:
    return std::make_unique<policies::LruPolicy<K, V, Hash, KeyEqual>>();
  case EvictionPolicy::Mru:
    return std::make_unique<policies::MruPolicy<K, V, Hash, KeyEqual>>();
  case EvictionPolicy::Lfu:
    return std::make_unique<policies::LfuPolicy<K, V, Hash, KeyEqual>>();
  case EvictionPolicy::Random:
    return std::make_unique<policies::RandomPolicy<K, V, Hash, KeyEqual>>(
        seed);
  }
  return nullptr;
}

} // namespace ttl_cache
