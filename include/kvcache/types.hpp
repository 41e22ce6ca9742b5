#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kvcache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using Bytes = std::vector<std::uint8_t>;

enum class ErrorKind { None, Transport, Store, Serialization };

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;

  explicit operator bool() const { return kind != ErrorKind::None; }
};

const char *error_kind_name(ErrorKind kind);

// Fills *err when err is non-null. Always returns false so call sites can
// `return fail(err, ...)`.
bool fail(Error *err, ErrorKind kind, std::string message);

inline Bytes to_bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace kvcache
