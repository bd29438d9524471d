#pragma once

#include <chrono>
#include <memory>

namespace chatrelay::util {

/*
  Cancellation context.

  Copies share state. Cancelling a context cancels every context derived
  from it; a derived context inherits the parent's deadline and may
  tighten it. Waiting on a context is the only sleep primitive used by
  rate limiting, retry backoff and shutdown paths.
*/
class Context {
 public:
  using Clock = std::chrono::steady_clock;

  static Context Background();

  Context WithCancel() const;
  Context WithTimeout(std::chrono::milliseconds timeout) const;

  void Cancel() const;

  // True once cancelled or past the deadline.
  bool Done() const;

  // Sleeps for `duration`. Returns false if the context finished first.
  bool WaitFor(std::chrono::milliseconds duration) const;

  // Throws Cancelled when Done().
  void ThrowIfDone() const;

 private:
  struct State;

  explicit Context(std::shared_ptr<State> state);

  static void CancelState(const std::shared_ptr<State>& state);

  std::shared_ptr<State> state_;
};

} // namespace chatrelay::util
