#include "task_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace chatrelay::runtime {

// Shared with the workers so Run never reaches into the executor itself.
struct TaskExecutor::Shared {
  std::string name;
  TaskQueue   queue;

  std::mutex              mutex;
  std::condition_variable idle_cv;
  std::size_t             outstanding = 0; // submitted, not yet finished
  std::size_t             running     = 0;
};

TaskExecutor::TaskExecutor(std::size_t threads, std::string name) : shared_(std::make_shared<Shared>()) {
  shared_->name = std::move(name);
  if (threads == 0) threads = 1;

  shared_->running = threads;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&TaskExecutor::Run, shared_);
  }
}

TaskExecutor::~TaskExecutor() {
  Stop(std::chrono::seconds(5));
  Join();
}

bool TaskExecutor::Submit(Task task) {
  {
    std::lock_guard lock(shared_->mutex);
    ++shared_->outstanding;
  }
  if (shared_->queue.Enqueue(std::move(task))) return true;

  {
    std::lock_guard lock(shared_->mutex);
    --shared_->outstanding;
  }
  shared_->idle_cv.notify_all();
  return false;
}

void TaskExecutor::Run(std::shared_ptr<Shared> shared) {
  while (auto task = shared->queue.Dequeue()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      CHATRELAY_LOG_ERROR("task_failed", {observability::StringField("executor", shared->name), observability::StringField("error", e.what())});
    }

    {
      std::lock_guard lock(shared->mutex);
      --shared->outstanding;
    }
    shared->idle_cv.notify_all();
  }

  {
    std::lock_guard lock(shared->mutex);
    --shared->running;
  }
  shared->idle_cv.notify_all();
}

bool TaskExecutor::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(shared_->mutex);
  return shared_->idle_cv.wait_for(lock, timeout, [&] { return shared_->outstanding == 0; });
}

bool TaskExecutor::Stop(std::chrono::milliseconds grace) {
  if (stopped_) return true;
  stopped_ = true;

  shared_->queue.Shutdown();

  bool drained = false;
  {
    std::unique_lock lock(shared_->mutex);
    drained = shared_->idle_cv.wait_for(lock, grace, [&] { return shared_->running == 0; });
  }

  if (drained) {
    Join();
    return true;
  }

  const auto dropped = shared_->queue.Clear();
  {
    std::lock_guard lock(shared_->mutex);
    shared_->outstanding -= std::min(dropped, shared_->outstanding);
  }
  CHATRELAY_LOG_WARN("executor_overran", {observability::StringField("executor", shared_->name), observability::IntField("dropped", static_cast<std::int64_t>(dropped))});
  return false;
}

void TaskExecutor::Join() {
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

std::size_t TaskExecutor::Pending() const {
  return shared_->queue.Size();
}

} // namespace chatrelay::runtime
