#pragma once

#include "kvcache/types.hpp"

#include <any>
#include <charconv>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace kvcache {

// Byte codec for keys and values. Both directions fail with a message in
// *err rather than throwing.
class ISerializer {
public:
  virtual ~ISerializer() = default;
  virtual std::string name() const = 0;
  virtual std::optional<Bytes> serialize(const std::any &value,
                                         std::string *err) const = 0;
  virtual std::optional<std::any> deserialize(const Bytes &bytes,
                                              std::string *err) const = 0;
};

// std::string (or a C string) as its raw characters.
class StringSerializer final : public ISerializer {
public:
  std::string name() const override { return "string"; }
  std::optional<Bytes> serialize(const std::any &value,
                                 std::string *err) const override;
  std::optional<std::any> deserialize(const Bytes &bytes,
                                      std::string *err) const override;
};

std::string unsupported_type_message(const std::string &serializer,
                                     const std::type_info &type);

// Arithmetic values as decimal text.
template <typename T> class GenericToStringSerializer final : public ISerializer {
  static_assert(std::is_arithmetic_v<T>,
                "GenericToStringSerializer needs an arithmetic type");

public:
  std::string name() const override { return "to_string"; }

  std::optional<Bytes> serialize(const std::any &value,
                                 std::string *err) const override {
    const T *v = std::any_cast<T>(&value);
    if (!v) {
      if (err)
        *err = unsupported_type_message(name(), value.type());
      return std::nullopt;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *v);
    if (ec != std::errc()) {
      if (err)
        *err = "value does not fit the text buffer";
      return std::nullopt;
    }
    return Bytes(buf, ptr);
  }

  std::optional<std::any> deserialize(const Bytes &bytes,
                                      std::string *err) const override {
    const auto *first = reinterpret_cast<const char *>(bytes.data());
    const auto *last = first + bytes.size();
    T out{};
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (bytes.empty() || ec != std::errc() || ptr != last) {
      if (err)
        *err = "cannot parse '" + to_string(bytes) + "' as a number";
      return std::nullopt;
    }
    return std::any(out);
  }
};

} // namespace kvcache
