#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace kiosk::runtime {

/*
  Cooperative single-thread scheduling.

  All tasks run on one logical thread, one at a time. Timer expiry and
  posted completions are the only suspension points, so state touched
  exclusively from tasks needs no locks.

  Post() may be called from any thread. ScheduleAfter()/Cancel() are
  thread-safe too, but callers normally use them from inside a task.
*/
class Scheduler {
 public:
  using Task      = std::function<void()>;
  using TimerId   = std::uint64_t;
  using SteadyTime = std::chrono::steady_clock::time_point;

  static constexpr TimerId kNoTimer = 0;

  virtual ~Scheduler() = default;

  // Returns false if the scheduler no longer accepts work.
  virtual bool Post(Task task) = 0;

  virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

  // Cancelling an expired or unknown timer is a no-op.
  virtual void Cancel(TimerId id) = 0;

  virtual SteadyTime Now() const = 0;
};

} // namespace kiosk::runtime
