#include "kvcache/cache.hpp"
#include "kvcache/config.hpp"
#include "kvcache/resp_store.hpp"
#include "kvcache/serializer.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

void usage() {
  std::cerr << "usage: kvcache_cli [--config file] [--host h] [--port p]\n"
               "                   [--password pw] [--db n] [--name cache]\n"
               "                   [--prefix p] [--ttl seconds]\n"
               "                   <get|put|evict|clear|info> [key] [value]\n";
}

int report(const kvcache::Error &err) {
  std::cerr << kvcache::error_kind_name(err.kind) << " error: " << err.message
            << "\n";
  return 1;
}
} // namespace

int main(int argc, char **argv) {
  kvcache::CacheConfig cache_cfg;
  cache_cfg.name = "default";
  kvcache::RespStoreConfig store_cfg;
  std::vector<std::string> positional;

  // --config is applied first so flags override file values.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      std::string err;
      if (!kvcache::load_config(argv[i + 1], cache_cfg, store_cfg, &err)) {
        std::cerr << "config " << argv[i + 1] << ": " << err << "\n";
        return 2;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t n = 0;
    if (a == "--config" && i + 1 < argc) {
      ++i;
    } else if (a == "--host" && i + 1 < argc) {
      store_cfg.host = argv[++i];
    } else if (a == "--port" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n) || n == 0 || n > 65535) {
        std::cerr << "invalid port\n";
        return 2;
      }
      store_cfg.port = static_cast<int>(n);
    } else if (a == "--password" && i + 1 < argc) {
      store_cfg.password = argv[++i];
    } else if (a == "--db" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n)) {
        std::cerr << "invalid db\n";
        return 2;
      }
      store_cfg.db = static_cast<int>(n);
    } else if (a == "--name" && i + 1 < argc) {
      cache_cfg.name = argv[++i];
    } else if (a == "--prefix" && i + 1 < argc) {
      cache_cfg.prefix = kvcache::to_bytes(argv[++i]);
    } else if (a == "--ttl" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n)) {
        std::cerr << "invalid ttl\n";
        return 2;
      }
      cache_cfg.expiration = std::chrono::seconds(n);
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      positional.push_back(a);
    }
  }

  if (positional.empty()) {
    usage();
    return 2;
  }
  const std::string op = positional[0];
  const std::size_t want = op == "put" ? 3 : (op == "get" || op == "evict") ? 2 : 1;
  if (positional.size() != want ||
      (op != "get" && op != "put" && op != "evict" && op != "clear" &&
       op != "info")) {
    usage();
    return 2;
  }

  kvcache::RespStore store(store_cfg);
  kvcache::Error err;
  if (!store.connect(&err))
    return report(err);

  auto strings = std::make_shared<kvcache::StringSerializer>();
  std::unique_ptr<kvcache::Cache> cache;
  try {
    cache = std::make_unique<kvcache::Cache>(cache_cfg, store, strings, strings);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  if (op == "get") {
    auto v = cache->get_as<std::string>(positional[1], &err);
    if (err)
      return report(err);
    if (!v) {
      std::cout << "(nil)\n";
      return 0;
    }
    std::cout << *v << "\n";
    return 0;
  }
  if (op == "put") {
    if (!cache->put(positional[1], positional[2], &err))
      return report(err);
    std::cout << "OK\n";
    return 0;
  }
  if (op == "evict") {
    if (!cache->evict(positional[1], &err))
      return report(err);
    std::cout << "OK\n";
    return 0;
  }
  if (op == "clear") {
    if (!cache->clear(&err))
      return report(err);
    const auto s = cache->stats();
    std::cout << (s.clears_skipped > 0 ? "SKIPPED (clear in progress)" : "OK")
              << "\n";
    return 0;
  }

  auto indexed = cache->indexed_size(&err);
  if (err)
    return report(err);
  std::cout << cache->info();
  std::cout << "indexed_keys:" << *indexed << "\n";
  return 0;
}
