#include "kvcache/memory_store.hpp"

#include <algorithm>
#include <iterator>

namespace kvcache {
namespace {
constexpr const char *kWrongType =
    "WRONGTYPE Operation against a key holding the wrong kind of value";

std::string key_of(const Bytes &b) { return std::string(b.begin(), b.end()); }
} // namespace

std::optional<Bytes> MemoryStore::get(const Bytes &key, Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  if (!check_type(k, Type::String, err))
    return std::nullopt;
  auto *slot = find_live(k);
  if (!slot)
    return std::nullopt;
  return to_bytes(slot->value);
}

bool MemoryStore::set(const Bytes &key, const Bytes &value, Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  do_set(key_of(key), key_of(value));
  return true;
}

bool MemoryStore::set_nx(const Bytes &key, const Bytes &value, bool *created,
                         Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  const bool absent = find_live(k) == nullptr;
  if (absent)
    do_set(k, key_of(value));
  if (created)
    *created = absent;
  return true;
}

std::optional<std::size_t> MemoryStore::del(const std::vector<Bytes> &keys,
                                            Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  std::size_t removed = 0;
  for (const auto &k : keys)
    removed += do_del(key_of(k));
  return removed;
}

std::optional<bool> MemoryStore::exists(const Bytes &key, Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  return find_live(key_of(key)) != nullptr;
}

bool MemoryStore::expire(const Bytes &key, std::chrono::seconds ttl, Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  do_expire(key_of(key), ttl);
  return true;
}

std::optional<std::int64_t> MemoryStore::ttl(const Bytes &key, Error *) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  auto *slot = find_live(key_of(key));
  if (!slot)
    return -2;
  if (!slot->ttl_deadline.has_value())
    return -1;
  const auto remain_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                             *slot->ttl_deadline - Clock::now())
                             .count();
  return std::max<std::int64_t>(0, (remain_ms + 500) / 1000);
}

bool MemoryStore::zadd(const Bytes &key, double score, const Bytes &member,
                       Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  if (!check_type(k, Type::ZSet, err))
    return false;
  do_zadd(k, score, key_of(member));
  return true;
}

std::optional<std::vector<Bytes>> MemoryStore::zrange(const Bytes &key,
                                                      std::int64_t start,
                                                      std::int64_t stop,
                                                      Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  if (!check_type(k, Type::ZSet, err))
    return std::nullopt;
  std::vector<Bytes> out;
  auto *slot = find_live(k);
  if (!slot)
    return out;

  const auto len = static_cast<std::int64_t>(slot->zset.by_rank.size());
  if (start < 0)
    start += len;
  if (stop < 0)
    stop += len;
  if (start < 0)
    start = 0;
  if (stop >= len)
    stop = len - 1;
  if (start > stop || start >= len)
    return out;

  out.reserve(static_cast<std::size_t>(stop - start + 1));
  auto it = std::next(slot->zset.by_rank.begin(), start);
  for (std::int64_t i = start; i <= stop; ++i, ++it)
    out.push_back(to_bytes(it->second));
  return out;
}

std::optional<std::size_t> MemoryStore::zrem(const Bytes &key,
                                             const std::vector<Bytes> &members,
                                             Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  if (!check_type(k, Type::ZSet, err))
    return std::nullopt;
  std::size_t removed = 0;
  for (const auto &m : members)
    removed += do_zrem(k, key_of(m));
  return removed;
}

std::optional<std::size_t> MemoryStore::zcard(const Bytes &key, Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.commands;
  const auto k = key_of(key);
  if (!check_type(k, Type::ZSet, err))
    return std::nullopt;
  auto *slot = find_live(k);
  return slot ? slot->zset.by_rank.size() : 0;
}

bool MemoryStore::exec(const Transaction &tx, Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.transactions;
  if (!validate(tx, err)) {
    ++stats_.transactions_aborted;
    return false;
  }
  for (const auto &op : tx.ops()) {
    ++stats_.commands;
    apply(op);
  }
  return true;
}

std::size_t MemoryStore::size() {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t live = 0;
  const auto now = Clock::now();
  for (const auto &[k, slot] : slots_) {
    if (!slot.ttl_deadline.has_value() || *slot.ttl_deadline > now)
      ++live;
  }
  return live;
}

MemoryStoreStats MemoryStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

MemoryStore::Slot *MemoryStore::find_live(const std::string &key) {
  auto it = slots_.find(key);
  if (it == slots_.end())
    return nullptr;
  if (it->second.ttl_deadline.has_value() &&
      *it->second.ttl_deadline <= Clock::now()) {
    slots_.erase(it);
    ++stats_.expirations;
    return nullptr;
  }
  return &it->second;
}

bool MemoryStore::check_type(const std::string &key, Type type, Error *err) {
  auto *slot = find_live(key);
  if (slot && slot->type != type)
    return fail(err, ErrorKind::Store, kWrongType);
  return true;
}

// Checks every queued op against the current key types and against the
// types earlier ops in the same unit would leave behind.
bool MemoryStore::validate(const Transaction &tx, Error *err) {
  std::unordered_map<std::string, std::optional<Type>> pending;
  auto type_of = [&](const std::string &k) -> std::optional<Type> {
    auto p = pending.find(k);
    if (p != pending.end())
      return p->second;
    auto *slot = find_live(k);
    if (!slot)
      return std::nullopt;
    return slot->type;
  };

  for (const auto &op : tx.ops()) {
    const auto k = key_of(op.key);
    switch (op.kind) {
    case TxOp::Kind::Set:
      pending[k] = Type::String;
      break;
    case TxOp::Kind::Del:
      pending[k] = std::nullopt;
      break;
    case TxOp::Kind::ZAdd:
    case TxOp::Kind::ZRem: {
      auto t = type_of(k);
      if (t.has_value() && *t != Type::ZSet)
        return fail(err, ErrorKind::Store, std::string("EXECABORT ") + kWrongType);
      if (op.kind == TxOp::Kind::ZAdd)
        pending[k] = Type::ZSet;
      break;
    }
    case TxOp::Kind::Expire:
      break;
    }
  }
  return true;
}

void MemoryStore::apply(const TxOp &op) {
  const auto k = key_of(op.key);
  switch (op.kind) {
  case TxOp::Kind::Set:
    do_set(k, key_of(op.arg));
    break;
  case TxOp::Kind::Del:
    do_del(k);
    break;
  case TxOp::Kind::ZAdd:
    do_zadd(k, op.score, key_of(op.arg));
    break;
  case TxOp::Kind::ZRem:
    do_zrem(k, key_of(op.arg));
    break;
  case TxOp::Kind::Expire:
    do_expire(k, std::chrono::seconds(op.seconds));
    break;
  }
}

void MemoryStore::do_set(const std::string &key, const std::string &value) {
  Slot slot;
  slot.type = Type::String;
  slot.value = value;
  slots_[key] = std::move(slot);
}

std::size_t MemoryStore::do_del(const std::string &key) {
  if (!find_live(key))
    return 0;
  slots_.erase(key);
  return 1;
}

bool MemoryStore::do_zadd(const std::string &key, double score,
                          const std::string &member) {
  auto *slot = find_live(key);
  if (!slot) {
    slot = &slots_[key];
    slot->type = Type::ZSet;
  }
  auto &z = slot->zset;
  auto it = z.scores.find(member);
  if (it != z.scores.end()) {
    z.by_rank.erase({it->second, member});
    it->second = score;
    z.by_rank.insert({score, member});
    return false;
  }
  z.scores.emplace(member, score);
  z.by_rank.insert({score, member});
  return true;
}

std::size_t MemoryStore::do_zrem(const std::string &key,
                                 const std::string &member) {
  auto *slot = find_live(key);
  if (!slot)
    return 0;
  auto &z = slot->zset;
  auto it = z.scores.find(member);
  if (it == z.scores.end())
    return 0;
  z.by_rank.erase({it->second, member});
  z.scores.erase(it);
  if (z.scores.empty())
    slots_.erase(key);
  return 1;
}

bool MemoryStore::do_expire(const std::string &key, std::chrono::seconds ttl) {
  auto *slot = find_live(key);
  if (!slot)
    return false;
  if (ttl.count() <= 0) {
    slots_.erase(key);
    return true;
  }
  slot->ttl_deadline = Clock::now() + ttl;
  return true;
}

} // namespace kvcache
