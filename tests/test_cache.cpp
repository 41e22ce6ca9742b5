#include "fault_store.hpp"
#include "kvcache/cache.hpp"
#include "kvcache/config.hpp"
#include "kvcache/memory_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace kvcache;
using kvcache::testing::FaultStore;

namespace {
CacheConfig config_for(const std::string &name, const std::string &prefix) {
  CacheConfig cfg;
  cfg.name = name;
  cfg.prefix = to_bytes(prefix);
  cfg.lock_wait = std::chrono::milliseconds(10);
  return cfg;
}

std::shared_ptr<const ISerializer> strings() {
  return std::make_shared<StringSerializer>();
}
} // namespace

TEST_CASE("put then get returns the stored value", "[cache]") {
  MemoryStore store;
  Cache cache(config_for("users", "app1:"), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("user42"), std::string("alice"), &err));
  auto v = cache.get_as<std::string>(std::string("user42"), &err);
  REQUIRE(v.has_value());
  CHECK(*v == "alice");

  CHECK(to_string(store.get(to_bytes("app1:user42"), &err).value()) ==
        "alice");
  auto members = store.zrange(cache.index_key(), 0, -1, &err).value();
  REQUIRE(members.size() == 1);
  CHECK(to_string(members[0]) == "app1:user42");
  CHECK(to_string(cache.index_key()) == "users~keys");
  CHECK(to_string(cache.lock_key()) == "users~lock");
}

TEST_CASE("missing keys are absent, not errors", "[cache]") {
  MemoryStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  Error err;
  CHECK_FALSE(cache.get(std::string("nope"), &err).has_value());
  CHECK_FALSE(err);
  CHECK(cache.stats().misses == 1);
  CHECK(cache.stats().errors == 0);
}

TEST_CASE("evict removes the entry and its index member", "[cache]") {
  MemoryStore store;
  Cache cache(config_for("c", "p:"), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("a"), std::string("1"), &err));
  REQUIRE(cache.put(std::string("b"), std::string("2"), &err));
  REQUIRE(cache.evict(std::string("a"), &err));
  CHECK_FALSE(cache.get(std::string("a"), &err).has_value());
  CHECK(cache.indexed_size(&err).value() == 1);

  REQUIRE(cache.evict(std::string("a"), &err));
  REQUIRE(cache.evict(std::string("never"), &err));
  CHECK_FALSE(err);
  CHECK(cache.get_as<std::string>(std::string("b"), &err).value() == "2");
}

TEST_CASE("overwriting a key keeps one index member", "[cache]") {
  MemoryStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("1"), &err));
  REQUIRE(cache.put(std::string("k"), std::string("2"), &err));
  CHECK(cache.get_as<std::string>(std::string("k"), &err).value() == "2");
  CHECK(cache.indexed_size(&err).value() == 1);
}

TEST_CASE("clear removes every entry across pages", "[cache][clear]") {
  MemoryStore store;
  auto cfg = config_for("orders", "o:");
  cfg.page_size = 128;
  Cache cache(cfg, store, strings(), strings());
  Error err;
  for (int i = 0; i < 300; ++i)
    REQUIRE(cache.put("order" + std::to_string(i), std::string("x"), &err));
  CHECK(cache.indexed_size(&err).value() == 300);

  REQUIRE(cache.clear(&err));
  CHECK(store.size() == 0);
  CHECK_FALSE(store.exists(cache.index_key(), &err).value());
  CHECK_FALSE(store.exists(cache.lock_key(), &err).value());
  for (int i = 0; i < 300; i += 37)
    CHECK_FALSE(cache.get("order" + std::to_string(i), &err).has_value());
  CHECK(cache.stats().clears == 1);

  REQUIRE(cache.clear(&err));
  CHECK(cache.stats().clears == 2);
}

TEST_CASE("clear of one cache leaves another cache alone", "[cache][clear]") {
  MemoryStore store;
  Cache users(config_for("users", "u:"), store, strings(), strings());
  Cache orders(config_for("orders", "o:"), store, strings(), strings());
  Error err;
  REQUIRE(users.put(std::string("1"), std::string("alice"), &err));
  REQUIRE(orders.put(std::string("1"), std::string("book"), &err));
  REQUIRE(orders.clear(&err));
  CHECK_FALSE(orders.get(std::string("1"), &err).has_value());
  CHECK(users.get_as<std::string>(std::string("1"), &err).value() == "alice");
}

TEST_CASE("orders scenario without prefix or expiration", "[cache]") {
  MemoryStore store;
  Cache orders(config_for("orders", ""), store, strings(), strings());
  Error err;
  REQUIRE(orders.put(std::string("42"), std::string("shipped"), &err));
  CHECK(orders.get_as<std::string>(std::string("42"), &err).value() ==
        "shipped");
  REQUIRE(orders.evict(std::string("42"), &err));
  CHECK_FALSE(orders.get(std::string("42"), &err).has_value());

  REQUIRE(orders.put(std::string("1"), std::string("a"), &err));
  REQUIRE(orders.put(std::string("2"), std::string("b"), &err));
  REQUIRE(orders.clear(&err));
  CHECK_FALSE(orders.get(std::string("1"), &err).has_value());
  CHECK_FALSE(orders.get(std::string("2"), &err).has_value());
  CHECK(orders.indexed_size(&err).value() == 0);
  CHECK_FALSE(err);
}

TEST_CASE("distinct prefixes keep equal keys apart", "[cache]") {
  MemoryStore store;
  Cache a(config_for("a", "app1:"), store, strings(), strings());
  Cache b(config_for("b", "app2:"), store, strings(), strings());
  Error err;
  REQUIRE(a.put(std::string("user42"), std::string("alice"), &err));
  REQUIRE(b.put(std::string("user42"), std::string("bob"), &err));
  CHECK(a.get_as<std::string>(std::string("user42"), &err).value() == "alice");
  CHECK(b.get_as<std::string>(std::string("user42"), &err).value() == "bob");
  REQUIRE(a.evict(std::string("user42"), &err));
  CHECK(b.get_as<std::string>(std::string("user42"), &err).value() == "bob");
}

TEST_CASE("clear is skipped while another clear holds the lock",
          "[cache][clear]") {
  MemoryStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  REQUIRE(store.set(cache.lock_key(), cache.lock_key(), &err));

  REQUIRE(cache.clear(&err));
  CHECK(cache.stats().clears_skipped == 1);
  CHECK(store.exists(cache.lock_key(), &err).value());
  CHECK(store.exists(to_bytes("k"), &err).value());
}

TEST_CASE("put waits for a running clear", "[cache][clear]") {
  MemoryStore store;
  auto cfg = config_for("c", "");
  cfg.lock_wait = std::chrono::milliseconds(20);
  Cache cache(cfg, store, strings(), strings());
  Error err;
  REQUIRE(store.set(cache.lock_key(), cache.lock_key(), &err));

  std::optional<std::size_t> removed;
  std::thread releaser([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    Error e;
    removed = store.del({cache.lock_key()}, &e);
  });
  const auto start = Clock::now();
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  const auto elapsed = Clock::now() - start;
  releaser.join();

  REQUIRE(removed.has_value());
  CHECK(elapsed >= std::chrono::milliseconds(100));
  CHECK(cache.stats().lock_waits == 1);
  CHECK(cache.get_as<std::string>(std::string("k"), &err).value() == "v");
}

TEST_CASE("get waits for a running clear", "[cache][clear]") {
  MemoryStore store;
  auto cfg = config_for("c", "");
  cfg.lock_wait = std::chrono::milliseconds(20);
  Cache cache(cfg, store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  REQUIRE(store.set(cache.lock_key(), cache.lock_key(), &err));

  std::optional<std::size_t> removed;
  std::thread releaser([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    Error e;
    removed = store.del({cache.lock_key()}, &e);
  });
  const auto start = Clock::now();
  auto v = cache.get_as<std::string>(std::string("k"), &err);
  const auto elapsed = Clock::now() - start;
  releaser.join();

  REQUIRE(removed.has_value());
  REQUIRE(v.has_value());
  CHECK(*v == "v");
  CHECK(elapsed >= std::chrono::milliseconds(100));
  CHECK(cache.stats().lock_waits == 1);
}

TEST_CASE("evict does not wait for a running clear", "[cache][clear]") {
  MemoryStore store;
  auto cfg = config_for("c", "");
  cfg.lock_wait = std::chrono::seconds(5);
  Cache cache(cfg, store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  REQUIRE(store.set(cache.lock_key(), cache.lock_key(), &err));

  const auto start = Clock::now();
  REQUIRE(cache.evict(std::string("k"), &err));
  CHECK(Clock::now() - start < std::chrono::seconds(1));
  CHECK(cache.stats().lock_waits == 0);
  CHECK_FALSE(store.exists(to_bytes("k"), &err).value());
  CHECK(cache.indexed_size(&err).value() == 0);
  CHECK(store.exists(cache.lock_key(), &err).value());
}

TEST_CASE("drain failure releases the lock and reports the error",
          "[cache][clear]") {
  FaultStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  Error err;
  for (int i = 0; i < 5; ++i)
    REQUIRE(cache.put("k" + std::to_string(i), std::string("v"), &err));

  store.fail_on(FaultStore::Op::ZRange);
  CHECK_FALSE(cache.clear(&err));
  CHECK(err.kind == ErrorKind::Transport);
  Error check;
  CHECK_FALSE(store.inner().exists(cache.lock_key(), &check).value());
  CHECK(cache.stats().errors == 1);

  store.fail_on(FaultStore::Op::None);
  Error retry;
  REQUIRE(cache.clear(&retry));
  CHECK(store.inner().size() == 0);
}

TEST_CASE("expiration applies to the value and the index", "[cache][ttl]") {
  MemoryStore store;
  auto cfg = config_for("c", "p:");
  cfg.expiration = std::chrono::seconds(60);
  Cache cache(cfg, store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  const auto value_ttl = store.ttl(to_bytes("p:k"), &err).value();
  const auto index_ttl = store.ttl(cache.index_key(), &err).value();
  CHECK(value_ttl > 0);
  CHECK(value_ttl <= 60);
  CHECK(index_ttl > 0);
  CHECK(index_ttl <= 60);

  MemoryStore store2;
  Cache forever(config_for("c", "p:"), store2, strings(), strings());
  REQUIRE(forever.put(std::string("k"), std::string("v"), &err));
  CHECK(store2.ttl(to_bytes("p:k"), &err).value() == -1);
  CHECK(store2.ttl(forever.index_key(), &err).value() == -1);
}

TEST_CASE("typed reads report a mismatch", "[cache][serializer]") {
  MemoryStore store;
  Cache cache(config_for("nums", "n:"), store,
              std::make_shared<GenericToStringSerializer<int>>(),
              std::make_shared<GenericToStringSerializer<long>>());
  Error err;
  REQUIRE(cache.put(7, 1234L, &err));
  CHECK(to_string(store.get(to_bytes("n:7"), &err).value()) == "1234");
  CHECK(cache.get_as<long>(7, &err).value() == 1234L);

  Error mismatch;
  CHECK_FALSE(cache.get_as<std::string>(7, &mismatch).has_value());
  CHECK(mismatch.kind == ErrorKind::Serialization);
}

TEST_CASE("serialization failures leave the store untouched",
          "[cache][serializer]") {
  MemoryStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  Error err;
  CHECK_FALSE(cache.put(std::string("k"), 42, &err));
  CHECK(err.kind == ErrorKind::Serialization);
  CHECK(store.size() == 0);

  Error key_err;
  CHECK_FALSE(cache.get(3.5, &key_err).has_value());
  CHECK(key_err.kind == ErrorKind::Serialization);
  CHECK(cache.stats().errors == 2);
}

TEST_CASE("raw byte mode stores keys and values as given",
          "[cache][serializer]") {
  MemoryStore store;
  Cache cache(config_for("raw", "ignored:"), store, nullptr, nullptr);
  const Bytes key{'r', 0x00, 'k'};
  const Bytes value{0x01, 0x02};
  Error err;
  REQUIRE(cache.put(key, value, &err));
  CHECK(store.get(key, &err).value() == value);
  CHECK(cache.get_as<Bytes>(key, &err).value() == value);
  REQUIRE(cache.clear(&err));
  CHECK(store.size() == 0);
}

TEST_CASE("store failures surface as transport errors", "[cache]") {
  FaultStore store;
  Cache cache(config_for("c", ""), store, strings(), strings());
  store.fail_on(FaultStore::Op::Exec);
  Error err;
  CHECK_FALSE(cache.put(std::string("k"), std::string("v"), &err));
  CHECK(err.kind == ErrorKind::Transport);

  store.fail_on(FaultStore::Op::Get);
  Error err2;
  CHECK_FALSE(cache.get(std::string("k"), &err2).has_value());
  CHECK(err2.kind == ErrorKind::Transport);
  CHECK(cache.stats().errors == 2);
}

TEST_CASE("failed evict leaves the value and its index member",
          "[cache]") {
  FaultStore store;
  Cache cache(config_for("c", "p:"), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));

  store.fail_on(FaultStore::Op::Exec);
  Error evict_err;
  CHECK_FALSE(cache.evict(std::string("k"), &evict_err));
  CHECK(evict_err.kind == ErrorKind::Transport);
  CHECK(cache.stats().evictions == 0);

  Error check;
  CHECK(store.inner().exists(to_bytes("p:k"), &check).value());
  auto members = store.inner().zrange(cache.index_key(), 0, -1, &check).value();
  REQUIRE(members.size() == 1);
  CHECK(to_string(members[0]) == "p:k");
}

TEST_CASE("constructor rejects unusable configs", "[cache]") {
  MemoryStore store;
  CHECK_THROWS_AS(Cache(config_for("", ""), store, strings(), strings()),
                  std::invalid_argument);
  auto cfg = config_for("c", "");
  cfg.page_size = 0;
  CHECK_THROWS_AS(Cache(cfg, store, strings(), strings()),
                  std::invalid_argument);
  cfg.page_size = kMaxPageSize + 1;
  CHECK_THROWS_AS(Cache(cfg, store, strings(), strings()),
                  std::invalid_argument);
  cfg.page_size = SIZE_MAX;
  CHECK_THROWS_AS(Cache(cfg, store, strings(), strings()),
                  std::invalid_argument);
}

TEST_CASE("largest page size still clears every key", "[cache][clear]") {
  MemoryStore store;
  auto cfg = config_for("c", "");
  cfg.page_size = kMaxPageSize;
  Cache cache(cfg, store, strings(), strings());
  Error err;
  for (int i = 0; i < 5; ++i)
    REQUIRE(cache.put("k" + std::to_string(i), std::string("v"), &err));
  REQUIRE(cache.clear(&err));
  CHECK(store.size() == 0);
}

TEST_CASE("INFO reports configuration and counters", "[cache][info]") {
  MemoryStore store;
  Cache cache(config_for("c", "p:"), store, strings(), strings());
  Error err;
  REQUIRE(cache.put(std::string("k"), std::string("v"), &err));
  REQUIRE(cache.get(std::string("k"), &err).has_value());
  auto i1 = cache.info();
  auto i2 = cache.info();
  CHECK(i1 == i2);
  CHECK(i1.find("cache_name:c\n") != std::string::npos);
  CHECK(i1.find("store:memory\n") != std::string::npos);
  CHECK(i1.find("hits:1\n") != std::string::npos);
  CHECK(i1.find("puts:1\n") != std::string::npos);
}

TEST_CASE("config reload clamps and invalid schema rejected atomically",
          "[cache][config]") {
  CacheConfig cache;
  cache.name = "default";
  RespStoreConfig store;

  const char *good = "kvcache_config_good.json";
  std::ofstream out(good);
  out << R"({"name":"orders","prefix":"o:","expiration_s":30,)"
      << R"("lock_wait_ms":0,"page_size":99999999,"host":"cache.local",)"
      << R"("port":70000,"db":3})";
  out.close();
  std::string err;
  REQUIRE(load_config(good, cache, store, &err));
  CHECK(cache.name == "orders");
  CHECK(to_string(cache.prefix) == "o:");
  CHECK(cache.expiration == std::chrono::seconds(30));
  CHECK(cache.lock_wait == std::chrono::milliseconds(1));
  CHECK(cache.page_size == (1u << 20));
  CHECK(store.host == "cache.local");
  CHECK(store.port == 65535);
  CHECK(store.db == 3);

  const char *bad = "kvcache_config_bad.json";
  std::ofstream bad_out(bad);
  bad_out << "not-json";
  bad_out.close();
  CHECK_FALSE(load_config(bad, cache, store, &err));
  CHECK(err == "invalid schema");
  CHECK(cache.name == "orders");

  CHECK_FALSE(parse_config(R"({"name":"","page_size":7})", cache, store, &err));
  CHECK(cache.page_size == (1u << 20));
  CHECK_FALSE(load_config("does_not_exist.json", cache, store, &err));
  CHECK(err == "config file not found");
}

TEST_CASE("shipped default config loads", "[cache][config]") {
  CacheConfig cache;
  cache.name = "unset";
  RespStoreConfig store;
  std::string err;
  const std::string path =
      std::string(KVCACHE_SOURCE_DIR) + "/config/kvcache.json";
  REQUIRE(load_config(path, cache, store, &err));
  CHECK(cache.name == "default");
  CHECK(cache.prefix.empty());
  CHECK(cache.expiration == std::chrono::seconds(0));
  CHECK(cache.lock_wait == std::chrono::milliseconds(300));
  CHECK(cache.page_size == 128);
  CHECK(store.host == "127.0.0.1");
  CHECK(store.port == 6379);
  CHECK(store.io_timeout == std::chrono::milliseconds(2000));

  MemoryStore mem;
  Cache from_file(cache, mem, strings(), strings());
  CHECK(from_file.name() == "default");
}
