#include "context.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <vector>

#include "errors.hpp"

namespace chatrelay::util {

struct Context::State {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    cancelled = false;

  std::optional<Clock::time_point>   deadline;
  std::vector<std::weak_ptr<State>> children;
};

Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {
}

Context Context::Background() {
  return Context(std::make_shared<State>());
}

Context Context::WithCancel() const {
  auto child = std::make_shared<State>();

  bool parent_cancelled = false;
  {
    std::lock_guard lock(state_->mutex);
    child->deadline  = state_->deadline;
    parent_cancelled = state_->cancelled;

    auto& children = state_->children;
    children.erase(std::remove_if(children.begin(), children.end(), [](const auto& w) { return w.expired(); }), children.end());
    children.push_back(child);
  }

  if (parent_cancelled) child->cancelled = true;
  return Context(child);
}

Context Context::WithTimeout(std::chrono::milliseconds timeout) const {
  Context    ctx      = WithCancel();
  const auto deadline = Clock::now() + timeout;

  std::lock_guard lock(ctx.state_->mutex);
  if (!ctx.state_->deadline || deadline < *ctx.state_->deadline) {
    ctx.state_->deadline = deadline;
  }
  return ctx;
}

void Context::CancelState(const std::shared_ptr<State>& state) {
  std::vector<std::weak_ptr<State>> children;
  {
    std::lock_guard lock(state->mutex);
    if (state->cancelled) return;
    state->cancelled = true;
    children.swap(state->children);
  }
  state->cv.notify_all();

  for (const auto& weak : children) {
    if (auto child = weak.lock()) CancelState(child);
  }
}

void Context::Cancel() const {
  CancelState(state_);
}

bool Context::Done() const {
  std::lock_guard lock(state_->mutex);
  if (state_->cancelled) return true;
  return state_->deadline && Clock::now() >= *state_->deadline;
}

bool Context::WaitFor(std::chrono::milliseconds duration) const {
  const auto until = Clock::now() + duration;

  std::unique_lock lock(state_->mutex);
  const bool       deadline_first = state_->deadline && *state_->deadline < until;
  const auto       wake           = deadline_first ? *state_->deadline : until;

  const bool cancelled = state_->cv.wait_until(lock, wake, [&] { return state_->cancelled; });
  if (cancelled) return false;
  return !deadline_first;
}

void Context::ThrowIfDone() const {
  if (Done()) throw Cancelled();
}

} // namespace chatrelay::util
