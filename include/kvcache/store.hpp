#pragma once

#include "kvcache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kvcache {

struct TxOp {
  enum class Kind { Set, Del, ZAdd, ZRem, Expire };

  Kind kind{Kind::Set};
  Bytes key;
  Bytes arg;
  double score{0.0};
  std::int64_t seconds{0};
};

// Commands queued for one all-or-nothing submission through
// IKeyValueStore::exec. Ops apply in the order they were queued.
class Transaction {
public:
  void set(const Bytes &key, const Bytes &value);
  void del(const Bytes &key);
  void zadd(const Bytes &key, double score, const Bytes &member);
  void zrem(const Bytes &key, const Bytes &member);
  void expire(const Bytes &key, std::chrono::seconds ttl);

  const std::vector<TxOp> &ops() const { return ops_; }
  std::size_t size() const { return ops_.size(); }
  bool empty() const { return ops_.empty(); }

private:
  std::vector<TxOp> ops_;
};

// Primitive operations a cache is built from. Implementations must be safe
// for concurrent use. Every call reports failure through `err`: Transport for
// connectivity or protocol faults, Store for errors the store answered with.
class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;
  virtual std::string name() const = 0;

  virtual std::optional<Bytes> get(const Bytes &key, Error *err) = 0;
  virtual bool set(const Bytes &key, const Bytes &value, Error *err) = 0;
  // *created is false when the key already existed; nothing is written then.
  virtual bool set_nx(const Bytes &key, const Bytes &value, bool *created,
                      Error *err) = 0;
  virtual std::optional<std::size_t> del(const std::vector<Bytes> &keys,
                                         Error *err) = 0;
  virtual std::optional<bool> exists(const Bytes &key, Error *err) = 0;
  virtual bool expire(const Bytes &key, std::chrono::seconds ttl,
                      Error *err) = 0;
  // Seconds to live, -1 for a key without expiry, -2 for a missing key.
  virtual std::optional<std::int64_t> ttl(const Bytes &key, Error *err) = 0;

  virtual bool zadd(const Bytes &key, double score, const Bytes &member,
                    Error *err) = 0;
  // Members by rank, both bounds inclusive; negative bounds count from the
  // end.
  virtual std::optional<std::vector<Bytes>>
  zrange(const Bytes &key, std::int64_t start, std::int64_t stop,
         Error *err) = 0;
  virtual std::optional<std::size_t> zrem(const Bytes &key,
                                          const std::vector<Bytes> &members,
                                          Error *err) = 0;
  virtual std::optional<std::size_t> zcard(const Bytes &key, Error *err) = 0;

  virtual bool exec(const Transaction &tx, Error *err) = 0;
};

} // namespace kvcache
