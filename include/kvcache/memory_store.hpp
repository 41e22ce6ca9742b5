#pragma once

#include "kvcache/store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace kvcache {

struct MemoryStoreStats {
  std::uint64_t commands{0};
  std::uint64_t transactions{0};
  std::uint64_t transactions_aborted{0};
  std::uint64_t expirations{0};
};

// In-process store with Redis semantics for the operations IKeyValueStore
// names. Expired keys are dropped lazily on access.
class MemoryStore final : public IKeyValueStore {
public:
  MemoryStore() = default;

  std::string name() const override { return "memory"; }

  std::optional<Bytes> get(const Bytes &key, Error *err) override;
  bool set(const Bytes &key, const Bytes &value, Error *err) override;
  bool set_nx(const Bytes &key, const Bytes &value, bool *created,
              Error *err) override;
  std::optional<std::size_t> del(const std::vector<Bytes> &keys,
                                 Error *err) override;
  std::optional<bool> exists(const Bytes &key, Error *err) override;
  bool expire(const Bytes &key, std::chrono::seconds ttl, Error *err) override;
  std::optional<std::int64_t> ttl(const Bytes &key, Error *err) override;

  bool zadd(const Bytes &key, double score, const Bytes &member,
            Error *err) override;
  std::optional<std::vector<Bytes>> zrange(const Bytes &key, std::int64_t start,
                                           std::int64_t stop,
                                           Error *err) override;
  std::optional<std::size_t> zrem(const Bytes &key,
                                  const std::vector<Bytes> &members,
                                  Error *err) override;
  std::optional<std::size_t> zcard(const Bytes &key, Error *err) override;

  bool exec(const Transaction &tx, Error *err) override;

  std::size_t size();
  MemoryStoreStats stats() const;

private:
  struct SortedSet {
    std::set<std::pair<double, std::string>> by_rank;
    std::unordered_map<std::string, double> scores;
  };

  enum class Type { String, ZSet };

  struct Slot {
    Type type{Type::String};
    std::string value;
    SortedSet zset;
    std::optional<TimePoint> ttl_deadline;
  };

  Slot *find_live(const std::string &key);
  bool check_type(const std::string &key, Type type, Error *err);
  bool validate(const Transaction &tx, Error *err);
  void apply(const TxOp &op);

  void do_set(const std::string &key, const std::string &value);
  std::size_t do_del(const std::string &key);
  bool do_zadd(const std::string &key, double score, const std::string &member);
  std::size_t do_zrem(const std::string &key, const std::string &member);
  bool do_expire(const std::string &key, std::chrono::seconds ttl);

  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> slots_;
  MemoryStoreStats stats_;
};

} // namespace kvcache
