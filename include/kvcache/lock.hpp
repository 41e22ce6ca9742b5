#pragma once

#include "kvcache/store.hpp"

#include <chrono>
#include <optional>

namespace kvcache {

class LockCoordinator {
public:
  LockCoordinator(IKeyValueStore &store, Bytes lock_key,
                  std::chrono::milliseconds wait);

  // Returns whether a lock was seen.
  std::optional<bool> await_unlocked(Error *err);

  std::optional<bool> try_enter_exclusive(Error *err);
  bool exit_exclusive(Error *err);

  const Bytes &key() const { return lock_key_; }
  std::chrono::milliseconds wait() const { return wait_; }

private:
  IKeyValueStore &store_;
  Bytes lock_key_;
  std::chrono::milliseconds wait_;
};

class ExclusiveGuard {
public:
  explicit ExclusiveGuard(LockCoordinator &lock) : lock_(&lock) {}
  ~ExclusiveGuard() { release(nullptr); }

  ExclusiveGuard(const ExclusiveGuard &) = delete;
  ExclusiveGuard &operator=(const ExclusiveGuard &) = delete;

  bool release(Error *err);

private:
  LockCoordinator *lock_;
};

} // namespace kvcache
