#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chatrelay::util {

/*
  One mutex per key, created on first use and dropped when the last
  holder or waiter for that key lets go.
*/
class KeyedMutex {
  struct Slot {
    std::mutex  mutex;
    std::size_t users = 0;
  };

 public:
  class Guard {
   public:
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    friend class KeyedMutex;
    Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot);

    KeyedMutex*                  owner_;
    std::string                  key_;
    std::shared_ptr<Slot>        slot_;
    std::unique_lock<std::mutex> lock_;
  };

  // Blocks until `key` is free.
  Guard Lock(const std::string& key);

  // Keys currently held or waited on.
  std::size_t Size() const;

 private:
  void Release(const std::string& key);

  mutable std::mutex                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace chatrelay::util
