#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace chatrelay::runtime {

/*
  Bounded worker pool running detached tasks (per-event processing,
  webhook deliveries, aggregation flushes).

  Task exceptions are caught at the worker boundary and logged.
  Stop() refuses new work, lets queued and in-flight tasks finish within
  the grace period, then drops whatever is still queued. Tasks already
  running past the grace are never detached: the destructor joins them,
  so anything they reference must outlive the executor. Owners destroy
  the executor before the objects its tasks touch.
*/
class TaskExecutor {
 public:
  explicit TaskExecutor(std::size_t threads, std::string name = "executor");
  ~TaskExecutor();

  TaskExecutor(const TaskExecutor&)            = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  // Returns false after Stop().
  bool Submit(Task task);

  // Returns true when every task finished within `grace`. On false the
  // queue is cleared but running tasks keep their workers until Join().
  bool Stop(std::chrono::milliseconds grace);

  // Blocks until every worker exited. Call after Stop().
  void Join();

  // Blocks until the queue is empty and no task is running, or `timeout` elapses.
  bool WaitIdle(std::chrono::milliseconds timeout);

  std::size_t Pending() const;

 private:
  struct Shared;

  static void Run(std::shared_ptr<Shared> shared);

  std::shared_ptr<Shared>  shared_;
  std::vector<std::thread> workers_;
  bool                     stopped_ = false;
};

} // namespace chatrelay::runtime
