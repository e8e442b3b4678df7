#include "event_loop.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace kiosk::runtime {

EventLoop::~EventLoop() {
  Stop();
}

void EventLoop::Start() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  running_ = true;
  thread_  = std::thread(&EventLoop::Run, this);
}

void EventLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    posted_.clear();
    timers_.clear();
    deadlines_.clear();
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

bool EventLoop::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return false;
    posted_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

Scheduler::TimerId EventLoop::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
  TimerId id;
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return kNoTimer;

    id                   = next_timer_id_++;
    const auto deadline  = Now() + delay;
    timers_.emplace(TimerKey{deadline, id}, std::move(task));
    deadlines_[id] = deadline;
  }
  cv_.notify_one();
  return id;
}

void EventLoop::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto            it = deadlines_.find(id);
  if (it == deadlines_.end()) return;

  timers_.erase(TimerKey{it->second, id});
  deadlines_.erase(it);
}

Scheduler::SteadyTime EventLoop::Now() const {
  return std::chrono::steady_clock::now();
}

void EventLoop::Run() {
  while (running_) {
    Task task;
    {
      std::unique_lock lock(mutex_);

      for (;;) {
        if (stopping_) return;

        if (!posted_.empty()) {
          task = std::move(posted_.front());
          posted_.pop_front();
          break;
        }

        if (!timers_.empty()) {
          auto first = timers_.begin();
          if (first->first.first <= Now()) {
            task = std::move(first->second);
            deadlines_.erase(first->first.second);
            timers_.erase(first);
            break;
          }
          cv_.wait_until(lock, first->first.first);
          continue;
        }

        cv_.wait(lock);
      }
    }

    RunTask(task);
  }
}

void EventLoop::RunTask(const Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    KIOSK_LOG_ERROR("Event loop task failed", {kiosk::observability::StringField("error", e.what())});
  }
}

} // namespace kiosk::runtime
