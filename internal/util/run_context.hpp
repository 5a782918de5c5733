#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace eventcache::util {

/*
  Cancellation + deadline carrier for one ingest run.

  Every blocking wait in the core (poll backoff, rate-limit recovery,
  request pacing) goes through WaitFor so a caller can abort the run from
  another thread or bound it with a deadline.
*/
class RunContext {
 public:
  using Clock = std::chrono::steady_clock;

  RunContext() = default;
  explicit RunContext(Clock::duration timeout);

  RunContext(const RunContext&)            = delete;
  RunContext& operator=(const RunContext&) = delete;

  void Cancel(std::string reason = "cancelled by caller");

  bool IsCancelled() const;

  std::optional<Clock::time_point> deadline() const {
    return deadline_;
  }

  // Throws CancelledError if the run was cancelled or the deadline passed.
  void ThrowIfCancelled() const;

  // Blocks for `duration` unless cancelled or past the deadline first,
  // in which case CancelledError is thrown.
  void WaitFor(std::chrono::milliseconds duration);

 private:
  std::optional<Clock::time_point> deadline_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    cancelled_ = false;
  std::string             reason_;
};

/*
  Seam over RunContext::WaitFor so tests can observe waits without sleeping.
*/
class Sleeper {
 public:
  virtual ~Sleeper() = default;

  virtual void Sleep(std::chrono::milliseconds duration, RunContext& ctx) = 0;
};

class ContextSleeper final : public Sleeper {
 public:
  void Sleep(std::chrono::milliseconds duration, RunContext& ctx) override {
    ctx.WaitFor(duration);
  }
};

} // namespace eventcache::util
