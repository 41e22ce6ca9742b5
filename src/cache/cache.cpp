#include "kvcache/cache.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace kvcache {
namespace {
CacheConfig validated(CacheConfig cfg) {
  if (cfg.name.empty())
    throw std::invalid_argument("non-empty cache name is required");
  if (cfg.page_size == 0 || cfg.page_size > kMaxPageSize)
    throw std::invalid_argument("cache page size must be in [1, " +
                                std::to_string(kMaxPageSize) + "]");
  return cfg;
}
} // namespace

Cache::Cache(CacheConfig cfg, IKeyValueStore &store,
             std::shared_ptr<const ISerializer> key_serializer,
             std::shared_ptr<const ISerializer> value_serializer)
    : cfg_(validated(std::move(cfg))), store_(store),
      value_serializer_(std::move(value_serializer)),
      codec_(cfg_.prefix, std::move(key_serializer)),
      index_(store_, to_bytes(cfg_.name + "~keys"), cfg_.page_size),
      lock_(store_, to_bytes(cfg_.name + "~lock"), cfg_.lock_wait) {}

std::optional<std::any> Cache::get(const std::any &key, Error *err) {
  ++counters_.gets;
  Error e;
  auto k = codec_.compute_key(key, &e);
  if (!k) {
    failed(err, e);
    return std::nullopt;
  }
  if (!await_unlocked(&e)) {
    failed(err, e);
    return std::nullopt;
  }
  auto raw = store_.get(*k, &e);
  if (e) {
    failed(err, e);
    return std::nullopt;
  }
  if (!raw) {
    ++counters_.misses;
    return std::nullopt;
  }
  auto value = decode_value(*raw, &e);
  if (!value) {
    failed(err, e);
    return std::nullopt;
  }
  ++counters_.hits;
  return value;
}

bool Cache::put(const std::any &key, const std::any &value, Error *err) {
  Error e;
  auto k = codec_.compute_key(key, &e);
  if (!k)
    return failed(err, e);
  if (!await_unlocked(&e))
    return failed(err, e);
  auto v = encode_value(value, &e);
  if (!v)
    return failed(err, e);

  Transaction tx;
  tx.set(*k, *v);
  index_.record(tx, *k);
  if (cfg_.expiration.count() > 0) {
    tx.expire(*k, cfg_.expiration);
    tx.expire(index_.key(), cfg_.expiration);
  }
  if (!store_.exec(tx, &e))
    return failed(err, e);
  ++counters_.puts;
  return true;
}

bool Cache::evict(const std::any &key, Error *err) {
  Error e;
  auto k = codec_.compute_key(key, &e);
  if (!k)
    return failed(err, e);
  Transaction tx;
  tx.del(*k);
  index_.forget(tx, *k);
  if (!store_.exec(tx, &e))
    return failed(err, e);
  ++counters_.evictions;
  return true;
}

bool Cache::clear(Error *err) {
  Error e;
  auto entered = lock_.try_enter_exclusive(&e);
  if (!entered)
    return failed(err, e);
  if (!*entered) {
    ++counters_.clears_skipped;
    return true;
  }

  ExclusiveGuard guard(lock_);
  if (!index_.drain_all(&e))
    return failed(err, e);
  if (!guard.release(&e))
    return failed(err, e);
  ++counters_.clears;
  return true;
}

std::optional<std::size_t> Cache::indexed_size(Error *err) {
  Error e;
  auto n = index_.size(&e);
  if (!n) {
    failed(err, e);
    return std::nullopt;
  }
  return n;
}

CacheStats Cache::stats() const {
  CacheStats s;
  s.gets = counters_.gets.load();
  s.hits = counters_.hits.load();
  s.misses = counters_.misses.load();
  s.puts = counters_.puts.load();
  s.evictions = counters_.evictions.load();
  s.clears = counters_.clears.load();
  s.clears_skipped = counters_.clears_skipped.load();
  s.lock_waits = counters_.lock_waits.load();
  s.errors = counters_.errors.load();
  return s;
}

std::string Cache::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "cache_name:" << cfg_.name << "\n";
  os << "store:" << store_.name() << "\n";
  os << "prefix_bytes:" << cfg_.prefix.size() << "\n";
  os << "expiration_s:" << cfg_.expiration.count() << "\n";
  os << "lock_wait_ms:" << cfg_.lock_wait.count() << "\n";
  os << "page_size:" << cfg_.page_size << "\n";
  os << "key_serializer:"
     << (codec_.serializer() ? codec_.serializer()->name() : "raw") << "\n";
  os << "value_serializer:"
     << (value_serializer_ ? value_serializer_->name() : "raw") << "\n";
  os << "gets:" << s.gets << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "puts:" << s.puts << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "clears:" << s.clears << "\n";
  os << "clears_skipped:" << s.clears_skipped << "\n";
  os << "lock_waits:" << s.lock_waits << "\n";
  os << "errors:" << s.errors << "\n";
  return os.str();
}

bool Cache::await_unlocked(Error *err) {
  auto waited = lock_.await_unlocked(err);
  if (!waited)
    return false;
  if (*waited)
    ++counters_.lock_waits;
  return true;
}

std::optional<Bytes> Cache::encode_value(const std::any &value,
                                         Error *err) const {
  if (!value_serializer_) {
    if (const auto *raw = std::any_cast<Bytes>(&value))
      return *raw;
    fail(err, ErrorKind::Serialization,
         std::string("no value serializer configured for value of type ") +
             value.type().name());
    return std::nullopt;
  }
  std::string why;
  auto out = value_serializer_->serialize(value, &why);
  if (!out)
    fail(err, ErrorKind::Serialization, why);
  return out;
}

std::optional<std::any> Cache::decode_value(const Bytes &bytes,
                                            Error *err) const {
  if (!value_serializer_)
    return std::any(bytes);
  std::string why;
  auto out = value_serializer_->deserialize(bytes, &why);
  if (!out)
    fail(err, ErrorKind::Serialization, why);
  return out;
}

bool Cache::failed(Error *err, const Error &cause) {
  ++counters_.errors;
  if (err)
    *err = cause;
  return false;
}

} // namespace kvcache
