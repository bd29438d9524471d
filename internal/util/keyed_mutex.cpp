#include "keyed_mutex.hpp"

#include <utility>

namespace chatrelay::util {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot)
    : owner_(owner), key_(std::move(key)), slot_(std::move(slot)), lock_(slot_->mutex) {}

KeyedMutex::Guard::~Guard() {
  lock_.unlock();
  owner_->Release(key_);
}

KeyedMutex::Guard KeyedMutex::Lock(const std::string& key) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = slots_[key];
    if (!entry) entry = std::make_shared<Slot>();
    ++entry->users;
    slot = entry;
  }
  return Guard(this, key, std::move(slot));
}

void KeyedMutex::Release(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it == slots_.end()) return;
  if (--it->second->users == 0) slots_.erase(it);
}

std::size_t KeyedMutex::Size() const {
  std::lock_guard lock(mutex_);
  return slots_.size();
}

} // namespace chatrelay::util
