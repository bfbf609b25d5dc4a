#pragma once

#include "ttl_cache/types.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ttl_cache {

// Authoritative key -> entry storage. Keeps a dense vector of keys next to
// the hash map so victims can be drawn by index and full scans run in a
// stable order. Expiry is never checked here.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class EntryTable {
public:
  using EntryType = Entry<V>;

  // Returns true when the key was new. Overwriting resets the counter and
  // the access time but keeps the key's dense position.
  bool insert(const K &key, V value, Duration ttl, TimePoint now) {
    auto it = slots_.find(key);
    if (it != slots_.end()) {
      auto &e = it->second.entry;
      e.value = std::move(value);
      e.ttl = ttl;
      e.access_count = 1;
      e.last_access = now;
      return false;
    }
    Slot slot{EntryType{std::move(value), ttl, 1, now}, order_.size()};
    slots_.emplace(key, std::move(slot));
    order_.push_back(key);
    return true;
  }

  EntryType *lookup(const K &key) {
    auto it = slots_.find(key);
    return it == slots_.end() ? nullptr : &it->second.entry;
  }

  const EntryType *lookup(const K &key) const {
    auto it = slots_.find(key);
    return it == slots_.end() ? nullptr : &it->second.entry;
  }

  bool touch(const K &key, TimePoint now) {
    auto *e = lookup(key);
    if (!e)
      return false;
    ++e->access_count;
    e->last_access = now;
    return true;
  }

  bool remove(const K &key) {
    auto it = slots_.find(key);
    if (it == slots_.end())
      return false;
    const std::size_t pos = it->second.pos;
    slots_.erase(it);
    const std::size_t last = order_.size() - 1;
    if (pos != last) {
      order_[pos] = std::move(order_[last]);
      slots_.find(order_[pos])->second.pos = pos;
    }
    order_.pop_back();
    return true;
  }

  void clear() {
    slots_.clear();
    order_.clear();
  }

  std::vector<K> all_keys() const { return order_; }

  std::vector<V> all_values() const {
    std::vector<V> out;
    out.reserve(order_.size());
    for (const auto &k : order_)
      out.push_back(slots_.find(k)->second.entry.value);
    return out;
  }

  // Visits entries in dense order: fn(const K &, const EntryType &).
  template <typename Fn> void for_each(Fn &&fn) const {
    for (const auto &k : order_)
      fn(k, slots_.find(k)->second.entry);
  }

  const K &key_at(std::size_t index) const { return order_[index]; }
  bool contains(const K &key) const { return slots_.find(key) != slots_.end(); }
  std::size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

private:
  struct Slot {
    EntryType entry;
    std::size_t pos;
  };

  std::unordered_map<K, Slot, Hash, KeyEqual> slots_;
  std::vector<K> order_;
};

} // namespace ttl_cache
