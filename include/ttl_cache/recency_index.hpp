#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ttl_cache {

// Live keys ordered front = most recently touched. The position map makes
// promotion and removal O(1).
template <typename K, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class RecencyIndex {
public:
  // A key that is already indexed is moved instead of duplicated.
  void push_front(const K &key) {
    if (move_to_front(key))
      return;
    order_.push_front(key);
    positions_.emplace(key, order_.begin());
  }

  bool move_to_front(const K &key) {
    auto it = positions_.find(key);
    if (it == positions_.end())
      return false;
    order_.splice(order_.begin(), order_, it->second);
    return true;
  }

  bool remove(const K &key) {
    auto it = positions_.find(key);
    if (it == positions_.end())
      return false;
    order_.erase(it->second);
    positions_.erase(it);
    return true;
  }

  std::optional<K> front() const {
    if (order_.empty())
      return std::nullopt;
    return order_.front();
  }

  std::optional<K> back() const {
    if (order_.empty())
      return std::nullopt;
    return order_.back();
  }

  void clear() {
    order_.clear();
    positions_.clear();
  }

  std::vector<K> keys() const {
    return std::vector<K>(order_.begin(), order_.end());
  }
  bool contains(const K &key) const {
    return positions_.find(key) != positions_.end();
  }
  std::size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

private:
  std::list<K> order_;
  std::unordered_map<K, typename std::list<K>::iterator, Hash, KeyEqual>
      positions_;
};

} // namespace ttl_cache
