#pragma once

#include "kvcache/serializer.hpp"

#include <any>
#include <memory>
#include <optional>

namespace kvcache {

// Maps logical keys to the physical keys stored in the backing store:
// serialized key bytes behind an optional namespace prefix.
class KeyCodec {
public:
  KeyCodec(Bytes prefix, std::shared_ptr<const ISerializer> serializer);

  // Without a serializer only Bytes keys are accepted, and they are returned
  // as is, without the prefix.
  std::optional<Bytes> compute_key(const std::any &key, Error *err) const;

  const Bytes &prefix() const { return prefix_; }
  const ISerializer *serializer() const { return serializer_.get(); }

private:
  Bytes prefix_;
  std::shared_ptr<const ISerializer> serializer_;
};

} // namespace kvcache
