#include "run_context.hpp"

#include "internal/util/errors.hpp"

namespace eventcache::util {

RunContext::RunContext(Clock::duration timeout) : deadline_(Clock::now() + timeout) {
}

void RunContext::Cancel(std::string reason) {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    reason_    = std::move(reason);
  }
  cv_.notify_all();
}

bool RunContext::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

void RunContext::ThrowIfCancelled() const {
  std::lock_guard lock(mutex_);
  if (cancelled_) {
    throw CancelledError("run cancelled: " + reason_);
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    throw CancelledError("run deadline exceeded");
  }
}

void RunContext::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(mutex_);

  auto wake_at = Clock::now() + duration;
  bool hits_deadline = false;
  if (deadline_ && *deadline_ < wake_at) {
    wake_at       = *deadline_;
    hits_deadline = true;
  }

  cv_.wait_until(lock, wake_at, [&] { return cancelled_; });

  if (cancelled_) {
    throw CancelledError("run cancelled during wait: " + reason_);
  }
  if (hits_deadline) {
    throw CancelledError("run deadline exceeded during wait");
  }
}

} // namespace eventcache::util
