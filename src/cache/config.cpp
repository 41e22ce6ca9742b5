#include "kvcache/config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace kvcache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = UINT64_MAX;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool parse_config(const std::string &text, CacheConfig &cache,
                  RespStoreConfig &store, std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig c = cache;
  RespStoreConfig s = store;
  std::uint64_t u;
  std::string str;

  if (extract_string(text, "name", str)) {
    if (str.empty()) {
      if (err)
        *err = "cache name must not be empty";
      return false;
    }
    c.name = str;
  }
  if (extract_string(text, "prefix", str))
    c.prefix = to_bytes(str);
  if (extract_u64(text, "expiration_s", u))
    c.expiration = std::chrono::seconds(clamp_u64(u, 0, 10ULL * 365 * 86400));
  if (extract_u64(text, "lock_wait_ms", u))
    c.lock_wait = std::chrono::milliseconds(clamp_u64(u, 1, 60 * 1000));
  if (extract_u64(text, "page_size", u))
    c.page_size = static_cast<std::size_t>(clamp_u64(u, 1, kMaxPageSize));

  if (extract_string(text, "host", str) && !str.empty())
    s.host = str;
  if (extract_u64(text, "port", u))
    s.port = static_cast<int>(clamp_u64(u, 1, 65535));
  if (extract_string(text, "password", str))
    s.password = str;
  if (extract_u64(text, "db", u))
    s.db = static_cast<int>(clamp_u64(u, 0, 1024));
  if (extract_u64(text, "io_timeout_ms", u))
    s.io_timeout = std::chrono::milliseconds(clamp_u64(u, 0, 10 * 60 * 1000));

  cache = std::move(c);
  store = std::move(s);
  return true;
}

bool load_config(const std::string &path, CacheConfig &cache,
                 RespStoreConfig &store, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cache, store, err);
}

} // namespace kvcache
