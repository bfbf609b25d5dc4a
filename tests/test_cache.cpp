#include "ttl_cache/cache.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace ttl_cache;
using namespace std::chrono_literals;

namespace {
using StringCache = Cache<std::string, std::string>;

CacheConfig config(std::size_t capacity, EvictionPolicy policy,
                   Duration interval = Duration::zero()) {
  CacheConfig cfg;
  cfg.capacity = capacity;
  cfg.policy = policy;
  cfg.clearing_interval = interval;
  cfg.random_seed = 7;
  return cfg;
}

bool present(StringCache &c, const std::string &key) {
  return c.get(key).has_value();
}
} // namespace

TEST_CASE("set then get returns the value", "[cache][basic]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  c.set("test_key", "test_value", 5s);
  Error err;
  auto v = c.get("test_key", &err);
  REQUIRE(v.has_value());
  CHECK(*v == "test_value");
}

TEST_CASE("missing and deleted keys report NotFound", "[cache][basic]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  Error err;
  CHECK_FALSE(c.get("never", &err).has_value());
  CHECK(err.code == ErrorCode::NotFound);
  CHECK(err.message == "cache not found for key: never");

  c.set("k", "v", 5s);
  REQUIRE(c.del("k"));
  err = {};
  CHECK_FALSE(c.get("k", &err).has_value());
  CHECK(err.code == ErrorCode::NotFound);

  err = {};
  CHECK_FALSE(c.del("k", &err));
  CHECK(err.code == ErrorCode::NotFound);
  CHECK(c.index_consistent());
}

TEST_CASE("expired entry is NotFound without a sweep", "[cache][ttl]") {
  StringCache c(config(10, EvictionPolicy::Lru, 1h));
  c.set("exp_key", "exp_value", 20ms);
  std::this_thread::sleep_for(40ms);
  Error err;
  CHECK_FALSE(c.get("exp_key", &err).has_value());
  CHECK(err.code == ErrorCode::NotFound);
  CHECK(c.size() == 0);
  CHECK(c.counters().expirations == 1);
  CHECK(c.index_consistent());
}

TEST_CASE("background sweep purges expired entries", "[cache][ttl]") {
  StringCache c(config(10, EvictionPolicy::Lru, 10ms));
  c.set("short", "v", 5ms);
  c.set("forever", "v", Duration::zero());
  std::this_thread::sleep_for(100ms);
  CHECK(c.size() == 1);
  CHECK(c.get_ttl("short") == std::nullopt);
  CHECK(c.get_ttl("forever") == Duration::zero());
  CHECK(c.index_consistent());
}

TEST_CASE("get refreshes the expiry clock", "[cache][ttl]") {
  StringCache c(config(10, EvictionPolicy::Lru, 1h));
  c.set("k", "v", 150ms);
  std::this_thread::sleep_for(100ms);
  REQUIRE(c.get("k").has_value());
  std::this_thread::sleep_for(100ms);
  CHECK(c.get("k").has_value());
}

TEST_CASE("purge_expired removes only elapsed entries", "[cache][ttl]") {
  StringCache c(config(0, EvictionPolicy::Lru, 1h));
  c.set("a", "1", 1ms);
  c.set("b", "2", 1ms);
  c.set("c", "3", 1h);
  std::this_thread::sleep_for(10ms);
  CHECK(c.purge_expired() == 2);
  CHECK(c.purge_expired() == 0);
  CHECK(c.size() == 1);
  CHECK(c.counters().expirations == 2);
}

TEST_CASE("set_ttl replaces ttl without resetting the clock", "[cache][ttl]") {
  StringCache c(config(10, EvictionPolicy::Lru, 1h));
  c.set("ttl_key", "value", 5s);
  REQUIRE(c.set_ttl("ttl_key", 10s));
  CHECK(c.get_ttl("ttl_key") == Duration(10s));

  c.set("short", "v", 1h);
  std::this_thread::sleep_for(30ms);
  REQUIRE(c.set_ttl("short", 20ms));
  CHECK_FALSE(c.get("short").has_value());

  Error err;
  CHECK_FALSE(c.set_ttl("missing", 1s, &err));
  CHECK(err.code == ErrorCode::NotFound);
  err = {};
  CHECK_FALSE(c.get_ttl("missing", &err).has_value());
  CHECK(err.code == ErrorCode::NotFound);
}

TEST_CASE("counter starts at one and grows per get", "[cache][counter]") {
  StringCache c(config(10, EvictionPolicy::Lfu));
  c.set("counter_key", "value", 5s);
  c.get("counter_key");
  c.get("counter_key");
  CHECK(c.get_counter("counter_key") == 3u);

  c.set("counter_key", "again", 5s);
  CHECK(c.get_counter("counter_key") == 1u);

  Error err;
  CHECK_FALSE(c.get_counter("missing", &err).has_value());
  CHECK(err.code == ErrorCode::NotFound);
}

TEST_CASE("capacity overflow evicts exactly one key", "[cache][capacity]") {
  StringCache c(config(3, EvictionPolicy::Lru));
  c.set("a", "1", 1h);
  c.set("b", "2", 1h);
  c.set("c", "3", 1h);
  c.set("d", "4", 1h);
  CHECK(c.size() == 3);
  CHECK(c.counters().evictions == 1);
  auto keys = c.keys();
  REQUIRE(keys.has_value());
  const int survivors =
      static_cast<int>(std::count_if(keys->begin(), keys->end(), [](auto &k) {
        return k == "a" || k == "b" || k == "c";
      }));
  CHECK(survivors == 2);
  CHECK(present(c, "d"));
}

TEST_CASE("overwriting a key at capacity still evicts one entry",
          "[cache][capacity]") {
  StringCache c(config(2, EvictionPolicy::Lru));
  c.set("k1", "v1", 1h);
  c.set("k2", "v2", 1h);
  c.get("k1");
  c.set("k2", "v2b", 1h);
  CHECK(c.size() == 2);
  CHECK(c.counters().evictions == 1);
  CHECK(c.index_consistent());
  CHECK(c.get("k2") == "v2b");
  CHECK(present(c, "k1"));

  // The get of k1 left k2 least recent, so the overwrite evicts k2 itself.
  c.set("k2", "v2c", 1h);
  CHECK(c.counters().evictions == 2);
  CHECK(c.size() == 2);
  CHECK(c.index_consistent());
  CHECK(c.get("k2") == "v2c");
}

TEST_CASE("very long TTLs never read as expired", "[cache][ttl]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  c.set("forever", "v", Duration::max());
  c.set("centuries", "v", std::chrono::hours(24 * 365 * 300));
  CHECK(c.get("forever") == "v");
  CHECK(c.get("centuries") == "v");
  CHECK(c.purge_expired() == 0);
  CHECK(c.size() == 2);
}

TEST_CASE("LRU evicts the least recently used", "[cache][policy]") {
  StringCache c(config(2, EvictionPolicy::Lru));
  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);
  c.get("k1");
  c.set("k3", "v3", 5s);
  CHECK_FALSE(present(c, "k2"));
  CHECK(present(c, "k1"));
  CHECK(present(c, "k3"));
}

TEST_CASE("LRU without reads evicts the oldest insert", "[cache][policy]") {
  StringCache c(config(2, EvictionPolicy::Lru));
  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);
  c.set("k3", "v3", 5s);
  CHECK_FALSE(present(c, "k1"));
  CHECK(present(c, "k2"));
  CHECK(present(c, "k3"));
}

TEST_CASE("MRU evicts the most recently used", "[cache][policy]") {
  StringCache c(config(2, EvictionPolicy::Mru));
  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);
  c.set("k3", "v3", 5s);
  CHECK_FALSE(present(c, "k2"));
  CHECK(present(c, "k1"));
  CHECK(present(c, "k3"));
}

TEST_CASE("LFU evicts the least frequently used", "[cache][policy]") {
  StringCache c(config(2, EvictionPolicy::Lfu));
  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);
  c.get("k1");
  c.get("k1");
  c.set("k3", "v3", 5s);
  CHECK_FALSE(present(c, "k2"));
  CHECK(present(c, "k1"));
  CHECK(present(c, "k3"));
}

TEST_CASE("RANDOM evicts exactly one of the old keys", "[cache][policy]") {
  for (std::uint64_t seed = 1; seed <= 20; ++seed) {
    auto cfg = config(2, EvictionPolicy::Random);
    cfg.random_seed = seed;
    StringCache c(cfg);
    c.set("k1", "v1", 5s);
    c.set("k2", "v2", 5s);
    c.set("k3", "v3", 5s);
    const bool has1 = present(c, "k1");
    const bool has2 = present(c, "k2");
    CHECK(has1 != has2);
    CHECK(present(c, "k3"));
  }
}

TEST_CASE("get_all and keys", "[cache][listing]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  Error err;
  CHECK_FALSE(c.keys(&err).has_value());
  CHECK(err.code == ErrorCode::EmptyCache);
  CHECK(c.get_all().empty());

  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);
  auto keys = c.keys();
  REQUIRE(keys.has_value());
  std::sort(keys->begin(), keys->end());
  CHECK(*keys == std::vector<std::string>{"k1", "k2"});

  auto all = c.get_all();
  std::sort(all.begin(), all.end());
  CHECK(all == std::vector<std::string>{"v1", "v2"});
}

TEST_CASE("clear empties the cache and it stays usable", "[cache][basic]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  c.set("k1", "v1", 5s);
  c.clear();
  CHECK_FALSE(present(c, "k1"));
  CHECK(c.size() == 0);
  c.set("k2", "v2", 5s);
  CHECK(present(c, "k2"));
  CHECK(c.index_consistent());
}

TEST_CASE("capacity is validated and enforced lazily", "[cache][config]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  REQUIRE(c.set_capacity(5));
  CHECK(c.capacity() == 5);

  Error err;
  CHECK_FALSE(c.set_capacity(-1, &err));
  CHECK(err.code == ErrorCode::InvalidCapacity);
  CHECK(c.capacity() == 5);

  for (int i = 0; i < 5; ++i)
    c.set("k" + std::to_string(i), "v", 1h);
  REQUIRE(c.set_capacity(2));
  CHECK(c.size() == 5);
  c.set("new", "v", 1h);
  CHECK(c.size() == 5);
  CHECK(c.counters().evictions == 1);

  REQUIRE(c.set_capacity(0));
  for (int i = 0; i < 50; ++i)
    c.set("u" + std::to_string(i), "v", 1h);
  CHECK(c.size() == 55);
}

TEST_CASE("eviction policy can be switched at runtime", "[cache][config]") {
  StringCache c(config(2, EvictionPolicy::Lru));
  CHECK(c.eviction_policy() == "LRU");
  REQUIRE(c.set_eviction_policy(1));
  CHECK(c.eviction_policy() == "MRU");

  Error err;
  CHECK_FALSE(c.set_eviction_policy(10, &err));
  CHECK(err.code == ErrorCode::InvalidPolicy);
  CHECK_FALSE(c.set_eviction_policy(-1));
  CHECK(c.eviction_policy() == "MRU");

  err = {};
  CHECK_FALSE(c.set_eviction_policy(std::string_view("fifo"), &err));
  CHECK(err.code == ErrorCode::InvalidPolicy);
  REQUIRE(c.set_eviction_policy(std::string_view("lfu")));
  CHECK(c.eviction_policy() == "LFU");
  REQUIRE(c.set_eviction_policy(EvictionPolicy::Random));
  CHECK(c.eviction_policy() == "RANDOM");
}

TEST_CASE("switching to MRU uses the existing recency order",
          "[cache][config]") {
  StringCache c(config(2, EvictionPolicy::Lru));
  c.set("k1", "v1", 1h);
  c.set("k2", "v2", 1h);
  c.get("k1");
  REQUIRE(c.set_eviction_policy(EvictionPolicy::Mru));
  c.set("k3", "v3", 1h);
  CHECK_FALSE(present(c, "k1"));
  CHECK(present(c, "k2"));
}

TEST_CASE("stats reports policy, capacity and occupancy", "[cache][stats]") {
  StringCache c(config(100, EvictionPolicy::Lru, 1s));
  c.set("k1", "v1", 5s);
  c.set("k2", "v2", 5s);

  const auto s = c.stats();
  CHECK(s.find("Eviction Policy: LRU") != std::string::npos);
  CHECK(s.find("Capacity: 100") != std::string::npos);
  CHECK(s.find("Clearing Interval: 1s") != std::string::npos);
  CHECK(s.find("Items: 2") != std::string::npos);
  CHECK(s.find("Occupancy: 2.00%") != std::string::npos);
  CHECK(s.find("Key: k1 Value: v1 TTL: 5s Counter: 1") != std::string::npos);
  CHECK(s.find("Key: k2 Value: v2") != std::string::npos);
  CHECK(c.stats() == s);
}

TEST_CASE("stats for an unlimited cache with default interval",
          "[cache][stats]") {
  StringCache c(config(0, EvictionPolicy::Random));
  const auto s = c.stats();
  CHECK(s.find("Eviction Policy: RANDOM") != std::string::npos);
  CHECK(s.find("Capacity: unlimited") != std::string::npos);
  CHECK(s.find("Clearing Interval: 1m40s") != std::string::npos);
  CHECK(s.find("Items: 0") != std::string::npos);
  CHECK(s.find("Occupancy: 0.00%") != std::string::npos);
  CHECK(c.clearing_interval() == kDefaultClearingInterval);
}

TEST_CASE("close stops the sweeper but not lazy expiry", "[cache][close]") {
  StringCache c(config(10, EvictionPolicy::Lru, 10ms));
  REQUIRE(c.sweeper_running());
  c.close();
  CHECK_FALSE(c.sweeper_running());
  c.close();

  c.set("k", "v", 5ms);
  c.set("other", "v", 5ms);
  std::this_thread::sleep_for(50ms);
  CHECK(c.size() == 2);
  CHECK_FALSE(present(c, "k"));
  CHECK(c.size() == 1);
}

TEST_CASE("hit and miss counters", "[cache][counters]") {
  StringCache c(config(10, EvictionPolicy::Lru));
  c.set("a", "1", 1h);
  c.get("a");
  c.get("a");
  c.get("b");
  const auto n = c.counters();
  CHECK(n.hits == 2);
  CHECK(n.misses == 1);
  CHECK(n.evictions == 0);
}

TEST_CASE("custom policy can be injected", "[cache][policy]") {
  struct FirstKeyPolicy final : IEvictionPolicy<int, int> {
    EvictionPolicy kind() const override { return EvictionPolicy::Lru; }
    std::string name() const override { return "FIRST"; }
    std::optional<int> pick_victim(const Table &entries,
                                   const Recency &) override {
      if (entries.empty())
        return std::nullopt;
      return entries.key_at(0);
    }
  };

  CacheConfig cfg;
  cfg.capacity = 2;
  Cache<int, int> c(cfg, std::make_unique<FirstKeyPolicy>());
  CHECK(c.eviction_policy() == "FIRST");
  c.set(1, 10);
  c.set(2, 20);
  c.set(3, 30);
  CHECK_FALSE(c.get(1).has_value());
  CHECK(c.get(2) == 20);
  CHECK(c.get(3) == 30);

  CHECK_THROWS_AS((Cache<int, int>(cfg, nullptr)), std::invalid_argument);
}

TEST_CASE("unprintable values still render stats", "[cache][stats]") {
  struct Blob {
    int bytes;
  };
  CacheConfig cfg;
  Cache<int, Blob> c(cfg);
  c.set(1, Blob{4});
  CHECK(c.stats().find("Key: 1 Value: <unprintable>") != std::string::npos);
}
