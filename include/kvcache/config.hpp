#pragma once

#include "kvcache/cache.hpp"
#include "kvcache/resp_store.hpp"

#include <string>

namespace kvcache {

// Reads a flat JSON object. Recognised keys: name, prefix, expiration_s,
// lock_wait_ms, page_size, host, port, password, db, io_timeout_ms. Keys that
// are absent keep the values already in `cache` / `store`; numbers are
// clamped. On failure neither output is modified.
bool load_config(const std::string &path, CacheConfig &cache,
                 RespStoreConfig &store, std::string *err = nullptr);

// Same as load_config, from the JSON text itself.
bool parse_config(const std::string &text, CacheConfig &cache,
                  RespStoreConfig &store, std::string *err = nullptr);

} // namespace kvcache
