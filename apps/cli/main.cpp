#include "ttl_cache/cache.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {
std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

// Milliseconds that fit in Duration; larger values would wrap negative.
bool parse_ms(const std::string &s, ttl_cache::Duration &out) {
  std::uint64_t u = 0;
  if (!parse_u64(s, u) ||
      u > static_cast<std::uint64_t>(
              std::numeric_limits<ttl_cache::Duration::rep>::max()))
    return false;
  out = ttl_cache::Duration(static_cast<ttl_cache::Duration::rep>(u));
  return true;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string tok;
  while (in >> tok)
    out.push_back(tok);
  return out;
}

void print_error(const ttl_cache::Error &err) {
  std::cout << "(error " << ttl_cache::error_code_name(err.code) << ") "
            << err.message << "\n";
}

void usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " [--config PATH] [--capacity N] [--interval-ms N]"
               " [--policy lru|mru|lfu|random] [--seed N]\n";
}
} // namespace

int main(int argc, char **argv) {
  ttl_cache::CacheConfig cfg;

  // --config is applied first so explicit flags override the file.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      ttl_cache::Error err;
      if (!ttl_cache::load_config_file(argv[i + 1], cfg, &err)) {
        std::cerr << "ttl_cache_cli: " << err.message << "\n";
        return 1;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t u = 0;
    if (a == "--config" && i + 1 < argc) {
      ++i;
    } else if (a == "--capacity" && i + 1 < argc && parse_u64(argv[i + 1], u)) {
      cfg.capacity = static_cast<std::size_t>(u);
      ++i;
    } else if (a == "--interval-ms" && i + 1 < argc &&
               parse_ms(argv[i + 1], cfg.clearing_interval)) {
      ++i;
    } else if (a == "--policy" && i + 1 < argc) {
      auto p = ttl_cache::parse_eviction_policy(argv[++i]);
      if (!p) {
        std::cerr << "ttl_cache_cli: unknown policy " << argv[i] << "\n";
        return 1;
      }
      cfg.policy = *p;
    } else if (a == "--seed" && i + 1 < argc && parse_u64(argv[i + 1], u)) {
      cfg.random_seed = u;
      ++i;
    } else {
      usage(argv[0]);
      return 1;
    }
  }

  ttl_cache::Cache<std::string, std::string> cache(cfg);
  std::cerr << "ttl_cache_cli: policy=" << cache.eviction_policy()
            << " capacity=" << cfg.capacity << " clearing_interval="
            << ttl_cache::format_duration(cache.clearing_interval()) << "\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    auto args = split(line);
    if (args.empty())
      continue;
    const auto op = upper(args[0]);
    ttl_cache::Error err;

    if (op == "QUIT" || op == "EXIT") {
      break;
    } else if (op == "SET" && (args.size() == 3 || args.size() == 4)) {
      ttl_cache::Duration ttl = ttl_cache::Duration::zero();
      if (args.size() == 4 && !parse_ms(args[3], ttl)) {
        std::cout << "(error) ttl must be a non-negative integer in range\n";
        continue;
      }
      cache.set(args[1], args[2], ttl);
      std::cout << "OK\n";
    } else if (op == "GET" && args.size() == 2) {
      auto v = cache.get(args[1], &err);
      if (v)
        std::cout << *v << "\n";
      else
        print_error(err);
    } else if (op == "DEL" && args.size() == 2) {
      if (cache.del(args[1], &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (op == "KEYS" && args.size() == 1) {
      auto keys = cache.keys(&err);
      if (!keys) {
        print_error(err);
        continue;
      }
      for (const auto &k : *keys)
        std::cout << k << "\n";
    } else if (op == "ALL" && args.size() == 1) {
      for (const auto &v : cache.get_all())
        std::cout << v << "\n";
    } else if (op == "CLEAR" && args.size() == 1) {
      cache.clear();
      std::cout << "OK\n";
    } else if (op == "TTL" && args.size() == 2) {
      auto ttl = cache.get_ttl(args[1], &err);
      if (ttl)
        std::cout << ttl_cache::format_duration(*ttl) << "\n";
      else
        print_error(err);
    } else if (op == "EXPIRE" && args.size() == 3) {
      ttl_cache::Duration ttl = ttl_cache::Duration::zero();
      if (!parse_ms(args[2], ttl)) {
        std::cout << "(error) ttl must be a non-negative integer in range\n";
        continue;
      }
      if (cache.set_ttl(args[1], ttl, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (op == "COUNTER" && args.size() == 2) {
      auto c = cache.get_counter(args[1], &err);
      if (c)
        std::cout << *c << "\n";
      else
        print_error(err);
    } else if (op == "CAPACITY" && args.size() == 1) {
      std::cout << cache.capacity() << "\n";
    } else if (op == "CAPACITY" && args.size() == 2) {
      std::int64_t n = 0;
      if (!parse_i64(args[1], n)) {
        std::cout << "(error) capacity must be an integer\n";
        continue;
      }
      if (cache.set_capacity(n, &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (op == "POLICY" && args.size() == 1) {
      std::cout << cache.eviction_policy() << "\n";
    } else if (op == "POLICY" && args.size() == 2) {
      std::int64_t n = 0;
      const bool ok =
          parse_i64(args[1], n)
              ? cache.set_eviction_policy(
                    n < 0 || n > 255 ? -1 : static_cast<int>(n), &err)
              : cache.set_eviction_policy(std::string_view(args[1]), &err);
      if (ok)
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (op == "STATS" && args.size() == 1) {
      const auto c = cache.counters();
      std::cout << cache.stats() << "hits:" << c.hits << " misses:" << c.misses
                << " evictions:" << c.evictions
                << " expirations:" << c.expirations << "\n";
    } else if (op == "PURGE" && args.size() == 1) {
      std::cout << cache.purge_expired() << "\n";
    } else {
      std::cout << "(error) unknown command or wrong number of arguments\n";
    }
  }

  cache.close();
  return 0;
}
