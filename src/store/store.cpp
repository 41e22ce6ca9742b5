#include "kvcache/store.hpp"

#include <utility>

namespace kvcache {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::Store:
    return "store";
  case ErrorKind::Serialization:
    return "serialization";
  }
  return "unknown";
}

bool fail(Error *err, ErrorKind kind, std::string message) {
  if (err) {
    err->kind = kind;
    err->message = std::move(message);
  }
  return false;
}

void Transaction::set(const Bytes &key, const Bytes &value) {
  ops_.push_back({TxOp::Kind::Set, key, value, 0.0, 0});
}

void Transaction::del(const Bytes &key) {
  ops_.push_back({TxOp::Kind::Del, key, {}, 0.0, 0});
}

void Transaction::zadd(const Bytes &key, double score, const Bytes &member) {
  ops_.push_back({TxOp::Kind::ZAdd, key, member, score, 0});
}

void Transaction::zrem(const Bytes &key, const Bytes &member) {
  ops_.push_back({TxOp::Kind::ZRem, key, member, 0.0, 0});
}

void Transaction::expire(const Bytes &key, std::chrono::seconds ttl) {
  ops_.push_back({TxOp::Kind::Expire, key, {}, 0.0, ttl.count()});
}

} // namespace kvcache
