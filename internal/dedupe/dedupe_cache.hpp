#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::dedupe {

/*
  Time-windowed "seen" set.

  Seen(id) reports whether `id` was recorded within the trailing window.
  A duplicate does not refresh the stored timestamp; a miss records the id
  with the current time. Empty ids are never duplicates and never stored.

  StartSweeper() runs a background eviction every sweep interval; the
  sweeper stops in Stop() or the destructor.
*/
class DedupeCache {
 public:
  DedupeCache(std::chrono::milliseconds window, std::chrono::milliseconds sweep_interval);
  ~DedupeCache();

  DedupeCache(const DedupeCache&)            = delete;
  DedupeCache& operator=(const DedupeCache&) = delete;

  bool Seen(const std::string& id);
  bool Seen(const std::string& id, util::TimePoint now);

  // Evicts entries older than the window. Returns how many were removed.
  std::size_t Sweep(util::TimePoint now);

  std::size_t Size() const;

  void StartSweeper();
  void Stop();

 private:
  const std::chrono::milliseconds window_;
  const std::chrono::milliseconds sweep_interval_;

  mutable std::mutex                               mutex_;
  std::unordered_map<std::string, util::TimePoint> seen_;

  util::Context stop_ = util::Context::Background();
  std::thread   sweeper_;
};

} // namespace chatrelay::dedupe
