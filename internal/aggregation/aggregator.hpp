#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "internal/runtime/task_executor.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace chatrelay::aggregation {

inline constexpr std::string_view kReasonStart   = "start";
inline constexpr std::string_view kReasonMessage = "message";
inline constexpr std::string_view kReasonTyping  = "typing";

/*
  Per-chat debounce window.

  The first message for a chat opens a window (count 1); later messages
  increment the count and push the deadline out; a typing signal pushes
  the deadline out only while the chat has buffered messages. A window
  with no reset until its deadline fires once: its state is cleared and
  the flush callback runs on the executor with (chat, count). Flushes of
  one chat never overlap.

  Flush callbacks may block for as long as a paced reply takes, so the
  executor must not be the one that feeds TouchMessage/TouchTyping.
*/
class Aggregator {
 public:
  using Clock   = std::chrono::steady_clock;
  using FlushFn = std::function<void(const std::string& chat, int count)>;
  using ResetFn = std::function<void(const std::string& chat, std::string_view reason, int count, std::chrono::milliseconds window)>;

  Aggregator(std::chrono::milliseconds window, runtime::TaskExecutor& executor, FlushFn on_flush, ResetFn on_reset = {});
  ~Aggregator();

  Aggregator(const Aggregator&)            = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  void TouchMessage(const std::string& chat);

  // Returns true when an open window was extended.
  bool TouchTyping(const std::string& chat);

  // Buffered messages in the open window, 0 when none.
  int Pending(const std::string& chat) const;

  std::chrono::milliseconds Window() const {
    return window_;
  }

  // Chats with a flush running or queued behind one.
  std::size_t ActiveFlushes() const {
    return flush_locks_.Size();
  }

  void Stop();

 private:
  struct State {
    int               count = 0;
    Clock::time_point deadline;
  };

  void TimerLoop();
  void Fire(const std::string& chat, int count);

  const std::chrono::milliseconds window_;
  runtime::TaskExecutor&          executor_;
  FlushFn                         on_flush_;
  ResetFn                         on_reset_;

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::unordered_map<std::string, State> windows_;
  bool                                   stop_ = false;

  util::KeyedMutex flush_locks_;

  std::thread timer_;
};

} // namespace chatrelay::aggregation
