#pragma once

#include "kvcache/resp.hpp"
#include "kvcache/store.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kvcache {

struct RespStoreConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::string password;
  int db{0};
  std::chrono::milliseconds io_timeout{2000};
};

struct RespStoreStats {
  std::uint64_t requests{0};
  std::uint64_t connects{0};
  std::uint64_t transport_errors{0};
};

// Synchronous client for a Redis-compatible server over one TCP
// connection. Calls are serialized on an internal mutex. A transport failure
// closes the connection; the next call reconnects.
class RespStore final : public IKeyValueStore {
public:
  explicit RespStore(RespStoreConfig cfg);
  ~RespStore() override;

  RespStore(const RespStore &) = delete;
  RespStore &operator=(const RespStore &) = delete;

  bool connect(Error *err = nullptr);
  void close();
  bool is_connected() const;

  std::string name() const override;

  std::optional<Bytes> get(const Bytes &key, Error *err) override;
  bool set(const Bytes &key, const Bytes &value, Error *err) override;
  bool set_nx(const Bytes &key, const Bytes &value, bool *created,
              Error *err) override;
  std::optional<std::size_t> del(const std::vector<Bytes> &keys,
                                 Error *err) override;
  std::optional<bool> exists(const Bytes &key, Error *err) override;
  bool expire(const Bytes &key, std::chrono::seconds ttl, Error *err) override;
  std::optional<std::int64_t> ttl(const Bytes &key, Error *err) override;

  bool zadd(const Bytes &key, double score, const Bytes &member,
            Error *err) override;
  std::optional<std::vector<Bytes>> zrange(const Bytes &key, std::int64_t start,
                                           std::int64_t stop,
                                           Error *err) override;
  std::optional<std::size_t> zrem(const Bytes &key,
                                  const std::vector<Bytes> &members,
                                  Error *err) override;
  std::optional<std::size_t> zcard(const Bytes &key, Error *err) override;

  bool exec(const Transaction &tx, Error *err) override;

  // Sends one command and returns its reply. Error replies are returned as
  // replies, not as failures.
  std::optional<RespReply> command(const std::vector<std::string> &args,
                                   Error *err = nullptr);

  RespStoreStats stats() const;

private:
  bool connect_locked(Error *err);
  void close_locked();
  std::optional<std::vector<RespReply>>
  roundtrip_locked(const std::vector<std::vector<std::string>> &cmds,
                   Error *err);
  bool send_all_locked(const std::string &payload, Error *err);
  std::optional<RespReply> read_reply_locked(Error *err);
  bool transport_failure_locked(Error *err, const std::string &what);

  std::optional<RespReply> call(const std::vector<std::string> &args,
                                Error *err);
  std::optional<long long> call_integer(const std::vector<std::string> &args,
                                        Error *err);

  RespStoreConfig cfg_;
  mutable std::mutex mu_;
  int fd_{-1};
  RespReplyParser parser_;
  RespStoreStats stats_;
};

} // namespace kvcache
