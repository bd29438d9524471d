#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace chatrelay::runtime {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue feeding executor workers.
*/
class TaskQueue {
 public:
  // Returns false once the queue is shut down.
  bool Enqueue(Task task);

  // blocking wait; nullopt after Shutdown() once drained
  std::optional<Task> Dequeue();

  void Shutdown();

  // Drops queued tasks. Returns how many were dropped.
  std::size_t Clear();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace chatrelay::runtime
