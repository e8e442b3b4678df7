#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>

#include "scheduler.hpp"

namespace kiosk::runtime {

/*
  Scheduler on a virtual clock, driven by the caller's thread.

  Nothing runs until RunPending() or AdvanceBy() is called, which makes
  timing-sensitive sequences deterministic in tests.
*/
class ManualScheduler : public Scheduler {
 public:
  ManualScheduler();

  bool       Post(Task task) override;
  TimerId    ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
  void       Cancel(TimerId id) override;
  SteadyTime Now() const override;

  // Runs posted tasks until none are left. Does not advance time.
  void RunPending();

  // Moves the clock forward, running every timer that falls due (and the
  // tasks they post) in deadline order.
  void AdvanceBy(std::chrono::milliseconds duration);

  std::chrono::milliseconds Elapsed() const;

  std::size_t PendingTimers() const;

 private:
  using TimerKey = std::pair<SteadyTime, TimerId>;

  bool PopPosted(Task* task);
  bool PopDueTimer(SteadyTime limit, Task* task);

  mutable std::mutex                      mutex_;
  SteadyTime                              origin_;
  SteadyTime                              now_;
  std::deque<Task>                        posted_;
  std::map<TimerKey, Task>                timers_;
  std::unordered_map<TimerId, SteadyTime> deadlines_;
  TimerId                                 next_timer_id_ = 1;
};

} // namespace kiosk::runtime
