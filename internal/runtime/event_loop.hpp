#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "scheduler.hpp"

namespace kiosk::runtime {

/*
  Scheduler backed by one worker thread.

  Posted tasks run in FIFO order; timers run when due, ordered by
  deadline then by creation. A task that throws is logged and the loop
  keeps going.
*/
class EventLoop : public Scheduler {
 public:
  EventLoop() = default;
  ~EventLoop() override;

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Start();

  // Drops pending work and joins the worker thread.
  void Stop();

  bool       Post(Task task) override;
  TimerId    ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
  void       Cancel(TimerId id) override;
  SteadyTime Now() const override;

 private:
  using TimerKey = std::pair<SteadyTime, TimerId>;

  void Run();
  void RunTask(const Task& task);

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Task>        posted_;
  std::map<TimerKey, Task>                timers_;
  std::unordered_map<TimerId, SteadyTime> deadlines_;
  TimerId                                 next_timer_id_ = 1;
  bool                                    stopping_      = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace kiosk::runtime
