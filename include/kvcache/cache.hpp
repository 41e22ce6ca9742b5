#pragma once

#include "kvcache/key_codec.hpp"
#include "kvcache/key_index.hpp"
#include "kvcache/lock.hpp"
#include "kvcache/serializer.hpp"
#include "kvcache/store.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kvcache {

constexpr std::size_t kMaxPageSize = 1 << 20;

struct CacheConfig {
  std::string name;
  Bytes prefix;
  // Zero keeps entries until evicted or cleared.
  std::chrono::seconds expiration{0};
  std::chrono::milliseconds lock_wait{300};
  std::size_t page_size{128};
};

struct CacheStats {
  std::uint64_t gets{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t puts{0};
  std::uint64_t evictions{0};
  std::uint64_t clears{0};
  std::uint64_t clears_skipped{0};
  std::uint64_t lock_waits{0};
  std::uint64_t errors{0};
};

// get()/put() wait while `<name>~lock` exists, but the wait is advisory: one
// that already passed the check can overlap a clear. With a positive
// expiration the index `<name>~keys` can expire before some values, which
// clear() then no longer removes.
class Cache {
public:
  // Throws std::invalid_argument for an empty name or a page size outside
  // [1, kMaxPageSize].
  Cache(CacheConfig cfg, IKeyValueStore &store,
        std::shared_ptr<const ISerializer> key_serializer,
        std::shared_ptr<const ISerializer> value_serializer);

  const std::string &name() const { return cfg_.name; }
  IKeyValueStore &store() const { return store_; }
  const CacheConfig &config() const { return cfg_; }
  const Bytes &index_key() const { return index_.key(); }
  const Bytes &lock_key() const { return lock_.key(); }

  std::optional<std::any> get(const std::any &key, Error *err = nullptr);

  template <typename T>
  std::optional<T> get_as(const std::any &key, Error *err = nullptr) {
    auto v = get(key, err);
    if (!v)
      return std::nullopt;
    if (const T *typed = std::any_cast<T>(&*v))
      return *typed;
    fail(err, ErrorKind::Serialization,
         std::string("cached value has type ") + v->type().name());
    ++counters_.errors;
    return std::nullopt;
  }

  bool put(const std::any &key, const std::any &value, Error *err = nullptr);
  bool evict(const std::any &key, Error *err = nullptr);
  // A clear already in progress elsewhere makes this a successful no-op.
  bool clear(Error *err = nullptr);

  std::optional<std::size_t> indexed_size(Error *err = nullptr);

  CacheStats stats() const;
  std::string info() const;

private:
  struct Counters {
    std::atomic<std::uint64_t> gets{0};
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> puts{0};
    std::atomic<std::uint64_t> evictions{0};
    std::atomic<std::uint64_t> clears{0};
    std::atomic<std::uint64_t> clears_skipped{0};
    std::atomic<std::uint64_t> lock_waits{0};
    std::atomic<std::uint64_t> errors{0};
  };

  bool await_unlocked(Error *err);
  std::optional<Bytes> encode_value(const std::any &value, Error *err) const;
  std::optional<std::any> decode_value(const Bytes &bytes, Error *err) const;
  bool failed(Error *err, const Error &cause);

  CacheConfig cfg_;
  IKeyValueStore &store_;
  std::shared_ptr<const ISerializer> value_serializer_;
  KeyCodec codec_;
  KeyIndex index_;
  LockCoordinator lock_;
  Counters counters_;
};

} // namespace kvcache
