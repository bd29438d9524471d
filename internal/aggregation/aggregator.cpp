#include "aggregator.hpp"

#include <optional>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace chatrelay::aggregation {

using observability::IntField;
using observability::StringField;

Aggregator::Aggregator(std::chrono::milliseconds window, runtime::TaskExecutor& executor, FlushFn on_flush, ResetFn on_reset)
    : window_(window), executor_(executor), on_flush_(std::move(on_flush)), on_reset_(std::move(on_reset)) {
  timer_ = std::thread(&Aggregator::TimerLoop, this);
}

Aggregator::~Aggregator() {
  Stop();
}

void Aggregator::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (timer_.joinable()) timer_.join();
}

void Aggregator::TouchMessage(const std::string& chat) {
  if (chat.empty()) return;

  int  count   = 0;
  bool started = false;
  {
    std::lock_guard lock(mutex_);
    auto&           state = windows_[chat];
    started               = state.count == 0;
    count                 = ++state.count;
    state.deadline        = Clock::now() + window_;
  }
  cv_.notify_all();

  if (on_reset_) on_reset_(chat, started ? kReasonStart : kReasonMessage, count, window_);
}

bool Aggregator::TouchTyping(const std::string& chat) {
  int count = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = windows_.find(chat);
    if (it == windows_.end() || it->second.count == 0) return false;
    it->second.deadline = Clock::now() + window_;
    count               = it->second.count;
  }
  cv_.notify_all();

  if (on_reset_) on_reset_(chat, kReasonTyping, count, window_);
  return true;
}

int Aggregator::Pending(const std::string& chat) const {
  std::lock_guard lock(mutex_);
  auto            it = windows_.find(chat);
  return it == windows_.end() ? 0 : it->second.count;
}

void Aggregator::Fire(const std::string& chat, int count) {
  auto accepted = executor_.Submit([this, chat, count] {
    auto flush_lock = flush_locks_.Lock(chat);
    CHATRELAY_LOG_INFO("agg_flush", {StringField("chat", chat), IntField("count", count)});
    on_flush_(chat, count);
  });
  if (!accepted) {
    CHATRELAY_LOG_WARN("agg_flush_dropped", {StringField("chat", chat), IntField("count", count)});
  }
}

void Aggregator::TimerLoop() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    std::optional<Clock::time_point> next;
    for (const auto& [chat, state] : windows_) {
      if (!next || state.deadline < *next) next = state.deadline;
    }

    if (!next) {
      cv_.wait(lock, [&] { return stop_ || !windows_.empty(); });
      continue;
    }
    cv_.wait_until(lock, *next);
    if (stop_) break;

    const auto                               now = Clock::now();
    std::vector<std::pair<std::string, int>> due;
    for (auto it = windows_.begin(); it != windows_.end();) {
      if (it->second.deadline <= now) {
        due.emplace_back(it->first, it->second.count);
        it = windows_.erase(it);
      } else {
        ++it;
      }
    }

    lock.unlock();
    for (const auto& [chat, count] : due) Fire(chat, count);
    lock.lock();
  }
}

} // namespace chatrelay::aggregation
