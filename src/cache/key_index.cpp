#include "kvcache/key_index.hpp"

#include <cstdint>
#include <utility>

namespace kvcache {
namespace {
constexpr double kIndexScore = 0.0;
} // namespace

KeyIndex::KeyIndex(IKeyValueStore &store, Bytes index_key,
                   std::size_t page_size)
    : store_(store), index_key_(std::move(index_key)), page_size_(page_size) {}

void KeyIndex::record(Transaction &tx, const Bytes &key) const {
  tx.zadd(index_key_, kIndexScore, key);
}

void KeyIndex::forget(Transaction &tx, const Bytes &key) const {
  tx.zrem(index_key_, key);
}

bool KeyIndex::record(const Bytes &key, Error *err) {
  return store_.zadd(index_key_, kIndexScore, key, err);
}

bool KeyIndex::forget(const Bytes &key, Error *err) {
  return store_.zrem(index_key_, {key}, err).has_value();
}

std::optional<std::size_t> KeyIndex::drain_all(Error *err) {
  const auto page = static_cast<std::int64_t>(page_size_);
  std::size_t visited = 0;
  std::int64_t offset = 0;
  bool finished = false;
  // Value keys are deleted but stay members of the index until the index
  // itself goes, so rank ranges stay stable while paging.
  do {
    auto keys =
        store_.zrange(index_key_, offset * page, (offset + 1) * page - 1, err);
    if (!keys)
      return std::nullopt;
    finished = keys->size() < page_size_;
    ++offset;
    if (!keys->empty()) {
      if (!store_.del(*keys, err))
        return std::nullopt;
      visited += keys->size();
    }
  } while (!finished);

  if (!store_.del({index_key_}, err))
    return std::nullopt;
  return visited;
}

std::optional<std::size_t> KeyIndex::size(Error *err) {
  return store_.zcard(index_key_, err);
}

} // namespace kvcache
