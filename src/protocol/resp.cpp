#include "kvcache/resp.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace kvcache {
namespace {
constexpr int kMaxDepth = 16;
constexpr long long kMaxBulkLen = 512LL * 1024 * 1024;

bool parse_ll(const std::string &s, long long &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}
} // namespace

void RespReplyParser::feed(const char *data, std::size_t len) {
  buffer_.append(data, len);
}

void RespReplyParser::reset() {
  buffer_.clear();
  malformed_ = false;
  need_ = 0;
}

std::optional<RespReply> RespReplyParser::next_reply() {
  if (malformed_ || buffer_.empty() || buffer_.size() < need_)
    return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  need_ = buffer_.size() + 1;
  switch (parse_at(pos, reply, 0)) {
  case Parse::Incomplete:
    return std::nullopt;
  case Parse::Malformed: {
    malformed_ = true;
    RespReply bad;
    bad.type = RespReply::Type::Error;
    bad.str = "malformed RESP reply";
    return bad;
  }
  case Parse::Ok:
    break;
  }
  need_ = 0;
  buffer_.erase(0, pos);
  return reply;
}

bool RespReplyParser::read_line(std::size_t &pos, std::string &line) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return false;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return true;
}

RespReplyParser::Parse RespReplyParser::parse_at(std::size_t &pos,
                                                 RespReply &out,
                                                 int depth) {
  if (depth > kMaxDepth)
    return Parse::Malformed;
  if (pos >= buffer_.size())
    return Parse::Incomplete;
  const char marker = buffer_[pos];
  std::size_t cur = pos + 1;
  std::string line;
  if (!read_line(cur, line))
    return Parse::Incomplete;

  switch (marker) {
  case '+':
    out.type = RespReply::Type::Simple;
    out.str = line;
    break;
  case '-':
    out.type = RespReply::Type::Error;
    out.str = line;
    break;
  case ':':
    out.type = RespReply::Type::Integer;
    if (!parse_ll(line, out.integer))
      return Parse::Malformed;
    break;
  case '$': {
    long long len = 0;
    if (!parse_ll(line, len) || len < -1 || len > kMaxBulkLen)
      return Parse::Malformed;
    if (len == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    const auto data_end = cur + static_cast<std::size_t>(len);
    if (data_end + 2 > buffer_.size()) {
      need_ = std::max(need_, data_end + 2);
      return Parse::Incomplete;
    }
    if (buffer_.compare(data_end, 2, "\r\n") != 0)
      return Parse::Malformed;
    out.type = RespReply::Type::Bulk;
    out.str = buffer_.substr(cur, static_cast<std::size_t>(len));
    cur = data_end + 2;
    break;
  }
  case '*': {
    long long n = 0;
    if (!parse_ll(line, n) || n < -1 || n > 1024 * 1024)
      return Parse::Malformed;
    if (n == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    out.type = RespReply::Type::Array;
    out.elements.clear();
    // Every element takes at least three bytes.
    out.elements.reserve(std::min(static_cast<std::size_t>(n),
                                  (buffer_.size() - cur) / 3));
    for (long long i = 0; i < n; ++i) {
      RespReply child;
      auto r = parse_at(cur, child, depth + 1);
      if (r != Parse::Ok)
        return r;
      out.elements.push_back(std::move(child));
    }
    break;
  }
  default:
    return Parse::Malformed;
  }
  pos = cur;
  return Parse::Ok;
}

void RespParser::feed(const std::string &data) { buffer_ += data; }

std::optional<std::vector<std::string>> RespParser::next_command() {
  if (buffer_.empty())
    return std::nullopt;
  if (buffer_[0] != '*') {
    auto pos = buffer_.find("\r\n");
    if (pos == std::string::npos)
      return std::nullopt;
    buffer_.erase(0, pos + 2);
    return std::vector<std::string>{"__MALFORMED__"};
  }
  auto crlf = buffer_.find("\r\n");
  if (crlf == std::string::npos)
    return std::nullopt;
  long long argc = 0;
  if (!parse_ll(buffer_.substr(1, crlf - 1), argc) || argc < 0 ||
      argc > 1024 * 1024) {
    buffer_.erase(0, crlf + 2);
    return std::vector<std::string>{"__MALFORMED__"};
  }
  std::size_t pos = crlf + 2;
  std::vector<std::string> out;
  out.reserve(std::min(static_cast<std::size_t>(argc),
                       (buffer_.size() - pos) / 3));
  for (long long i = 0; i < argc; ++i) {
    std::string token;
    if (!parse_bulk_string(pos, token))
      return std::nullopt;
    out.push_back(std::move(token));
  }
  buffer_.erase(0, pos);
  return out;
}

bool RespParser::parse_bulk_string(std::size_t &pos, std::string &out) const {
  if (pos >= buffer_.size() || buffer_[pos] != '$')
    return false;
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return false;
  long long len = 0;
  if (!parse_ll(buffer_.substr(pos + 1, crlf - (pos + 1)), len))
    return false;
  if (len < 0 || len > kMaxBulkLen)
    return false;
  std::size_t data_start = crlf + 2;
  std::size_t data_end = data_start + static_cast<std::size_t>(len);
  if (data_end + 2 > buffer_.size())
    return false;
  if (buffer_.compare(data_end, 2, "\r\n") != 0)
    return false;
  out = buffer_.substr(data_start, static_cast<std::size_t>(len));
  pos = data_end + 2;
  return true;
}

std::string encode_command(const std::vector<std::string> &args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto &a : args)
    out += "$" + std::to_string(a.size()) + "\r\n" + a + "\r\n";
  return out;
}

std::string resp_simple(const std::string &s) { return "+" + s + "\r\n"; }
std::string resp_error(const std::string &s) { return "-ERR " + s + "\r\n"; }
std::string resp_integer(long long v) {
  return ":" + std::to_string(v) + "\r\n";
}
std::string resp_bulk(const std::string &s) {
  return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}
std::string resp_null() { return "$-1\r\n"; }
std::string resp_null_array() { return "*-1\r\n"; }
std::string resp_array(const std::vector<std::string> &items) {
  std::string out = "*" + std::to_string(items.size()) + "\r\n";
  for (const auto &i : items)
    out += i;
  return out;
}

} // namespace kvcache
