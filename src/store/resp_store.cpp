#include "kvcache/resp_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace kvcache {
namespace {
std::string str_of(const Bytes &b) { return std::string(b.begin(), b.end()); }

std::string format_score(double score) {
  std::ostringstream os;
  os.precision(17);
  os << score;
  return os.str();
}

std::string tx_op_name(TxOp::Kind kind) {
  switch (kind) {
  case TxOp::Kind::Set:
    return "SET";
  case TxOp::Kind::Del:
    return "DEL";
  case TxOp::Kind::ZAdd:
    return "ZADD";
  case TxOp::Kind::ZRem:
    return "ZREM";
  case TxOp::Kind::Expire:
    return "EXPIRE";
  }
  return "PING";
}

std::vector<std::string> tx_op_args(const TxOp &op) {
  switch (op.kind) {
  case TxOp::Kind::Set:
    return {"SET", str_of(op.key), str_of(op.arg)};
  case TxOp::Kind::Del:
    return {"DEL", str_of(op.key)};
  case TxOp::Kind::ZAdd:
    return {"ZADD", str_of(op.key), format_score(op.score), str_of(op.arg)};
  case TxOp::Kind::ZRem:
    return {"ZREM", str_of(op.key), str_of(op.arg)};
  case TxOp::Kind::Expire:
    return {"EXPIRE", str_of(op.key), std::to_string(op.seconds)};
  }
  return {tx_op_name(op.kind)};
}

bool store_error(Error *err, const RespReply &reply) {
  return fail(err, ErrorKind::Store, reply.str);
}
} // namespace

RespStore::RespStore(RespStoreConfig cfg) : cfg_(std::move(cfg)) {}

RespStore::~RespStore() { close(); }

bool RespStore::connect(Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (fd_ >= 0)
    return true;
  return connect_locked(err);
}

void RespStore::close() {
  std::lock_guard<std::mutex> lock(mu_);
  close_locked();
}

bool RespStore::is_connected() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fd_ >= 0;
}

std::string RespStore::name() const {
  return "resp://" + cfg_.host + ":" + std::to_string(cfg_.port);
}

RespStoreStats RespStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

bool RespStore::connect_locked(Error *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  addrinfo *res = nullptr;
  const auto port = std::to_string(cfg_.port);
  const int gai = getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0 || !res) {
    ++stats_.transport_errors;
    return fail(err, ErrorKind::Transport,
                "resolve " + cfg_.host + ": " + gai_strerror(gai));
  }

  int fd = -1;
  for (auto *rp = res; rp; rp = rp->ai_next) {
    fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd < 0)
      continue;
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    ::close(fd);
    fd = -1;
  }
  freeaddrinfo(res);
  if (fd < 0) {
    ++stats_.transport_errors;
    return fail(err, ErrorKind::Transport,
                "connect " + cfg_.host + ":" + port + " failed");
  }

  int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  if (cfg_.io_timeout.count() > 0) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(cfg_.io_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((cfg_.io_timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }
  fd_ = fd;
  parser_.reset();
  ++stats_.connects;

  std::vector<std::vector<std::string>> handshake;
  if (!cfg_.password.empty())
    handshake.push_back({"AUTH", cfg_.password});
  if (cfg_.db > 0)
    handshake.push_back({"SELECT", std::to_string(cfg_.db)});
  if (handshake.empty())
    return true;

  auto replies = roundtrip_locked(handshake, err);
  if (!replies)
    return false;
  for (std::size_t i = 0; i < replies->size(); ++i) {
    if ((*replies)[i].is_error()) {
      close_locked();
      return fail(err, ErrorKind::Transport,
                  handshake[i][0] + " failed: " + (*replies)[i].str);
    }
  }
  return true;
}

void RespStore::close_locked() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  parser_.reset();
}

bool RespStore::transport_failure_locked(Error *err, const std::string &what) {
  ++stats_.transport_errors;
  close_locked();
  return fail(err, ErrorKind::Transport, what);
}

bool RespStore::send_all_locked(const std::string &payload, Error *err) {
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const auto n = ::send(fd_, payload.data() + sent, payload.size() - sent,
                          MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return transport_failure_locked(
          err, std::string("send failed: ") + std::strerror(errno));
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::optional<RespReply> RespStore::read_reply_locked(Error *err) {
  char buf[16384];
  while (true) {
    auto reply = parser_.next_reply();
    if (reply.has_value()) {
      if (parser_.malformed()) {
        transport_failure_locked(err, reply->str);
        return std::nullopt;
      }
      return reply;
    }
    const auto n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR)
      continue;
    if (n == 0) {
      transport_failure_locked(err, "connection closed by server");
      return std::nullopt;
    }
    if (n < 0) {
      const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
      transport_failure_locked(err, timed_out ? std::string("read timed out")
                                              : std::string("recv failed: ") +
                                                    std::strerror(errno));
      return std::nullopt;
    }
    parser_.feed(buf, static_cast<std::size_t>(n));
  }
}

std::optional<std::vector<RespReply>> RespStore::roundtrip_locked(
    const std::vector<std::vector<std::string>> &cmds, Error *err) {
  if (fd_ < 0 && !connect_locked(err))
    return std::nullopt;
  std::string payload;
  for (const auto &c : cmds)
    payload += encode_command(c);
  stats_.requests += cmds.size();
  if (!send_all_locked(payload, err))
    return std::nullopt;

  std::vector<RespReply> replies;
  replies.reserve(cmds.size());
  for (std::size_t i = 0; i < cmds.size(); ++i) {
    auto r = read_reply_locked(err);
    if (!r)
      return std::nullopt;
    replies.push_back(std::move(*r));
  }
  return replies;
}

std::optional<RespReply> RespStore::command(const std::vector<std::string> &args,
                                            Error *err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto replies = roundtrip_locked({args}, err);
  if (!replies)
    return std::nullopt;
  return std::move(replies->front());
}

std::optional<RespReply> RespStore::call(const std::vector<std::string> &args,
                                         Error *err) {
  auto reply = command(args, err);
  if (!reply)
    return std::nullopt;
  if (reply->is_error()) {
    store_error(err, *reply);
    return std::nullopt;
  }
  return reply;
}

std::optional<long long>
RespStore::call_integer(const std::vector<std::string> &args, Error *err) {
  auto reply = call(args, err);
  if (!reply)
    return std::nullopt;
  if (reply->type != RespReply::Type::Integer) {
    fail(err, ErrorKind::Transport,
         "unexpected reply to " + args.front() + ": expected integer");
    return std::nullopt;
  }
  return reply->integer;
}

std::optional<Bytes> RespStore::get(const Bytes &key, Error *err) {
  auto reply = call({"GET", str_of(key)}, err);
  if (!reply || reply->is_null())
    return std::nullopt;
  if (reply->type != RespReply::Type::Bulk) {
    fail(err, ErrorKind::Transport, "unexpected reply to GET");
    return std::nullopt;
  }
  return to_bytes(reply->str);
}

bool RespStore::set(const Bytes &key, const Bytes &value, Error *err) {
  return call({"SET", str_of(key), str_of(value)}, err).has_value();
}

bool RespStore::set_nx(const Bytes &key, const Bytes &value, bool *created,
                       Error *err) {
  auto reply = call({"SET", str_of(key), str_of(value), "NX"}, err);
  if (!reply)
    return false;
  if (created)
    *created = !reply->is_null();
  return true;
}

std::optional<std::size_t> RespStore::del(const std::vector<Bytes> &keys,
                                          Error *err) {
  if (keys.empty())
    return 0;
  std::vector<std::string> args;
  args.reserve(keys.size() + 1);
  args.push_back("DEL");
  for (const auto &k : keys)
    args.push_back(str_of(k));
  auto n = call_integer(args, err);
  if (!n)
    return std::nullopt;
  return static_cast<std::size_t>(*n);
}

std::optional<bool> RespStore::exists(const Bytes &key, Error *err) {
  auto n = call_integer({"EXISTS", str_of(key)}, err);
  if (!n)
    return std::nullopt;
  return *n > 0;
}

bool RespStore::expire(const Bytes &key, std::chrono::seconds ttl,
                       Error *err) {
  return call_integer({"EXPIRE", str_of(key), std::to_string(ttl.count())}, err)
      .has_value();
}

std::optional<std::int64_t> RespStore::ttl(const Bytes &key, Error *err) {
  auto n = call_integer({"TTL", str_of(key)}, err);
  if (!n)
    return std::nullopt;
  return static_cast<std::int64_t>(*n);
}

bool RespStore::zadd(const Bytes &key, double score, const Bytes &member,
                     Error *err) {
  return call_integer({"ZADD", str_of(key), format_score(score), str_of(member)},
                      err)
      .has_value();
}

std::optional<std::vector<Bytes>> RespStore::zrange(const Bytes &key,
                                                    std::int64_t start,
                                                    std::int64_t stop,
                                                    Error *err) {
  auto reply = call({"ZRANGE", str_of(key), std::to_string(start),
                     std::to_string(stop)},
                    err);
  if (!reply)
    return std::nullopt;
  if (reply->type != RespReply::Type::Array) {
    fail(err, ErrorKind::Transport, "unexpected reply to ZRANGE");
    return std::nullopt;
  }
  std::vector<Bytes> out;
  out.reserve(reply->elements.size());
  for (const auto &e : reply->elements)
    out.push_back(to_bytes(e.str));
  return out;
}

std::optional<std::size_t> RespStore::zrem(const Bytes &key,
                                           const std::vector<Bytes> &members,
                                           Error *err) {
  if (members.empty())
    return 0;
  std::vector<std::string> args{"ZREM", str_of(key)};
  for (const auto &m : members)
    args.push_back(str_of(m));
  auto n = call_integer(args, err);
  if (!n)
    return std::nullopt;
  return static_cast<std::size_t>(*n);
}

std::optional<std::size_t> RespStore::zcard(const Bytes &key, Error *err) {
  auto n = call_integer({"ZCARD", str_of(key)}, err);
  if (!n)
    return std::nullopt;
  return static_cast<std::size_t>(*n);
}

// MULTI, the queued commands and EXEC go out as one pipelined write while
// holding the connection, so no other caller's command lands inside the unit.
bool RespStore::exec(const Transaction &tx, Error *err) {
  if (tx.empty())
    return true;
  std::vector<std::vector<std::string>> cmds;
  cmds.reserve(tx.size() + 2);
  cmds.push_back({"MULTI"});
  for (const auto &op : tx.ops())
    cmds.push_back(tx_op_args(op));
  cmds.push_back({"EXEC"});

  std::lock_guard<std::mutex> lock(mu_);
  auto replies = roundtrip_locked(cmds, err);
  if (!replies)
    return false;

  if ((*replies)[0].is_error())
    return store_error(err, (*replies)[0]);
  for (std::size_t i = 1; i + 1 < replies->size(); ++i) {
    if ((*replies)[i].is_error())
      return fail(err, ErrorKind::Store,
                  tx_op_name(tx.ops()[i - 1].kind) + " rejected: " +
                      (*replies)[i].str);
  }
  const auto &result = replies->back();
  if (result.is_error())
    return store_error(err, result);
  if (result.is_null())
    return fail(err, ErrorKind::Store, "transaction aborted");
  for (const auto &r : result.elements) {
    if (r.is_error())
      return store_error(err, r);
  }
  return true;
}

} // namespace kvcache
