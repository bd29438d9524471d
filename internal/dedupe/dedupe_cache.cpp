#include "dedupe_cache.hpp"

#include "internal/observability/logging.hpp"

namespace chatrelay::dedupe {

DedupeCache::DedupeCache(std::chrono::milliseconds window, std::chrono::milliseconds sweep_interval)
    : window_(window), sweep_interval_(sweep_interval) {
}

DedupeCache::~DedupeCache() {
  Stop();
}

bool DedupeCache::Seen(const std::string& id) {
  return Seen(id, util::Now());
}

bool DedupeCache::Seen(const std::string& id, util::TimePoint now) {
  if (id.empty()) return false;

  std::lock_guard lock(mutex_);

  auto it = seen_.find(id);
  if (it != seen_.end() && now - it->second <= window_) {
    return true;
  }

  seen_[id] = now;
  return false;
}

std::size_t DedupeCache::Sweep(util::TimePoint now) {
  const auto cutoff = now - window_;

  std::lock_guard lock(mutex_);

  std::size_t removed = 0;
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (it->second < cutoff) {
      it = seen_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t DedupeCache::Size() const {
  std::lock_guard lock(mutex_);
  return seen_.size();
}

void DedupeCache::StartSweeper() {
  if (sweeper_.joinable()) return;

  sweeper_ = std::thread([this] {
    while (stop_.WaitFor(sweep_interval_)) {
      const auto removed = Sweep(util::Now());
      if (removed > 0) {
        CHATRELAY_LOG_DEBUG("dedupe_sweep", {observability::IntField("removed", static_cast<std::int64_t>(removed))});
      }
    }
  });
}

void DedupeCache::Stop() {
  stop_.Cancel();
  if (sweeper_.joinable()) sweeper_.join();
}

} // namespace chatrelay::dedupe
