#include "kvcache/lock.hpp"

#include <thread>
#include <utility>

namespace kvcache {

LockCoordinator::LockCoordinator(IKeyValueStore &store, Bytes lock_key,
                                 std::chrono::milliseconds wait)
    : store_(store), lock_key_(std::move(lock_key)), wait_(wait) {}

std::optional<bool> LockCoordinator::await_unlocked(Error *err) {
  bool found_lock = false;
  while (true) {
    auto locked = store_.exists(lock_key_, err);
    if (!locked)
      return std::nullopt;
    if (!*locked)
      return found_lock;
    found_lock = true;
    std::this_thread::sleep_for(wait_);
  }
}

std::optional<bool> LockCoordinator::try_enter_exclusive(Error *err) {
  bool created = false;
  if (!store_.set_nx(lock_key_, lock_key_, &created, err))
    return std::nullopt;
  return created;
}

bool LockCoordinator::exit_exclusive(Error *err) {
  return store_.del({lock_key_}, err).has_value();
}

bool ExclusiveGuard::release(Error *err) {
  if (!lock_)
    return true;
  auto *lock = lock_;
  lock_ = nullptr;
  return lock->exit_exclusive(err);
}

} // namespace kvcache
