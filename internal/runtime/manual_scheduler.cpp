#include "manual_scheduler.hpp"

namespace kiosk::runtime {

ManualScheduler::ManualScheduler() : origin_(std::chrono::steady_clock::now()), now_(origin_) {
}

bool ManualScheduler::Post(Task task) {
  std::lock_guard lock(mutex_);
  posted_.push_back(std::move(task));
  return true;
}

Scheduler::TimerId ManualScheduler::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
  std::lock_guard lock(mutex_);
  const TimerId   id       = next_timer_id_++;
  const auto      deadline = now_ + delay;
  timers_.emplace(TimerKey{deadline, id}, std::move(task));
  deadlines_[id] = deadline;
  return id;
}

void ManualScheduler::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto            it = deadlines_.find(id);
  if (it == deadlines_.end()) return;

  timers_.erase(TimerKey{it->second, id});
  deadlines_.erase(it);
}

Scheduler::SteadyTime ManualScheduler::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualScheduler::RunPending() {
  Task task;
  while (PopPosted(&task)) {
    task();
  }
}

void ManualScheduler::AdvanceBy(std::chrono::milliseconds duration) {
  SteadyTime limit;
  {
    std::lock_guard lock(mutex_);
    limit = now_ + duration;
  }

  RunPending();

  Task task;
  while (PopDueTimer(limit, &task)) {
    task();
    RunPending();
  }

  std::lock_guard lock(mutex_);
  now_ = limit;
}

std::chrono::milliseconds ManualScheduler::Elapsed() const {
  std::lock_guard lock(mutex_);
  return std::chrono::duration_cast<std::chrono::milliseconds>(now_ - origin_);
}

std::size_t ManualScheduler::PendingTimers() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

bool ManualScheduler::PopPosted(Task* task) {
  std::lock_guard lock(mutex_);
  if (posted_.empty()) return false;

  *task = std::move(posted_.front());
  posted_.pop_front();
  return true;
}

bool ManualScheduler::PopDueTimer(SteadyTime limit, Task* task) {
  std::lock_guard lock(mutex_);
  if (timers_.empty()) return false;

  auto first = timers_.begin();
  if (first->first.first > limit) return false;

  // the clock jumps to each deadline so timers scheduled from a timer are
  // measured from the moment it fired
  now_  = first->first.first;
  *task = std::move(first->second);
  deadlines_.erase(first->first.second);
  timers_.erase(first);
  return true;
}

} // namespace kiosk::runtime
