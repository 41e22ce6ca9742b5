#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kvcache {

struct RespReply {
  enum class Type { Simple, Error, Integer, Bulk, Null, Array };

  Type type{Type::Null};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool is_error() const { return type == Type::Error; }
  bool is_null() const { return type == Type::Null; }
};

// Incremental parser for server replies. A malformed stream makes
// next_reply() return an Error reply with `malformed()` set; the buffer is
// unusable afterwards.
class RespReplyParser {
public:
  void feed(const char *data, std::size_t len);
  void feed(const std::string &data) { feed(data.data(), data.size()); }
  std::optional<RespReply> next_reply();
  bool malformed() const { return malformed_; }
  void reset();

private:
  enum class Parse { Ok, Incomplete, Malformed };
  Parse parse_at(std::size_t &pos, RespReply &out, int depth);
  bool read_line(std::size_t &pos, std::string &line) const;

  std::string buffer_;
  // Buffer size below which the pending reply cannot be complete.
  std::size_t need_{0};
  bool malformed_{false};
};

// Incremental parser for client commands (arrays of bulk strings).
class RespParser {
public:
  void feed(const std::string &data);
  std::optional<std::vector<std::string>> next_command();

private:
  bool parse_bulk_string(std::size_t &pos, std::string &out) const;
  std::string buffer_;
};

std::string encode_command(const std::vector<std::string> &args);

std::string resp_simple(const std::string &s);
std::string resp_error(const std::string &s);
std::string resp_integer(long long v);
std::string resp_bulk(const std::string &s);
std::string resp_null();
std::string resp_null_array();
std::string resp_array(const std::vector<std::string> &items);

} // namespace kvcache
