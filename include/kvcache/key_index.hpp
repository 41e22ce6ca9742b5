#pragma once

#include "kvcache/store.hpp"

#include <cstddef>
#include <optional>

namespace kvcache {

// Secondary index of every physical key a cache has written: one sorted set
// whose members all carry score 0, so iteration follows byte order of the
// keys.
class KeyIndex {
public:
  KeyIndex(IKeyValueStore &store, Bytes index_key, std::size_t page_size);

  // Queue the index update into a caller's atomic unit.
  void record(Transaction &tx, const Bytes &key) const;
  void forget(Transaction &tx, const Bytes &key) const;

  bool record(const Bytes &key, Error *err);
  bool forget(const Bytes &key, Error *err);

  // Deletes every indexed key page by page, then the index itself. Returns
  // the number of index members visited. Not atomic across pages: a failure
  // leaves the remaining keys and the index in place.
  std::optional<std::size_t> drain_all(Error *err);

  std::optional<std::size_t> size(Error *err);

  const Bytes &key() const { return index_key_; }
  std::size_t page_size() const { return page_size_; }

private:
  IKeyValueStore &store_;
  Bytes index_key_;
  std::size_t page_size_;
};

} // namespace kvcache
