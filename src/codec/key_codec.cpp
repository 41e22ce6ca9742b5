#include "kvcache/key_codec.hpp"

#include <utility>

namespace kvcache {

KeyCodec::KeyCodec(Bytes prefix, std::shared_ptr<const ISerializer> serializer)
    : prefix_(std::move(prefix)), serializer_(std::move(serializer)) {}

std::optional<Bytes> KeyCodec::compute_key(const std::any &key,
                                           Error *err) const {
  if (!serializer_) {
    const auto *raw = std::any_cast<Bytes>(&key);
    if (!raw) {
      fail(err, ErrorKind::Serialization,
           std::string("no key serializer configured for key of type ") +
               key.type().name());
      return std::nullopt;
    }
    // Raw keys are taken as already physical; the prefix is not applied.
    return *raw;
  }

  std::string why;
  auto serialized = serializer_->serialize(key, &why);
  if (!serialized) {
    fail(err, ErrorKind::Serialization, why);
    return std::nullopt;
  }
  Bytes k = std::move(*serialized);

  if (prefix_.empty())
    return k;
  Bytes out;
  out.reserve(prefix_.size() + k.size());
  out.insert(out.end(), prefix_.begin(), prefix_.end());
  out.insert(out.end(), k.begin(), k.end());
  return out;
}

} // namespace kvcache
