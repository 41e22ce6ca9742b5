#include "kvcache/serializer.hpp"

namespace kvcache {

std::string unsupported_type_message(const std::string &serializer,
                                     const std::type_info &type) {
  return serializer + " serializer cannot handle values of type " + type.name();
}

std::optional<Bytes> StringSerializer::serialize(const std::any &value,
                                                 std::string *err) const {
  if (const auto *s = std::any_cast<std::string>(&value))
    return to_bytes(*s);
  if (const auto *c = std::any_cast<const char *>(&value)) {
    if (*c)
      return to_bytes(*c);
  }
  if (err)
    *err = unsupported_type_message(name(), value.type());
  return std::nullopt;
}

std::optional<std::any> StringSerializer::deserialize(const Bytes &bytes,
                                                      std::string *) const {
  return std::any(to_string(bytes));
}

} // namespace kvcache
