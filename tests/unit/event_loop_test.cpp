#include "internal/runtime/event_loop.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "internal/runtime/manual_scheduler.hpp"

using kiosk::runtime::EventLoop;
using kiosk::runtime::ManualScheduler;
using namespace std::chrono_literals;

namespace {

void TestPostedTasksRunInOrder() {
  EventLoop loop;
  loop.Start();

  std::mutex         mutex;
  std::vector<int>   order;
  std::promise<void> done;

  for (int i = 0; i < 5; ++i) {
    loop.Post([&, i] {
      std::lock_guard lock(mutex);
      order.push_back(i);
    });
  }
  loop.Post([&] { done.set_value(); });

  assert(done.get_future().wait_for(2s) == std::future_status::ready);
  loop.Stop();

  assert((order == std::vector<int>{0, 1, 2, 3, 4}));
}

void TestTimersFireByDeadlineAndCancelWorks() {
  EventLoop loop;
  loop.Start();

  std::mutex         mutex;
  std::vector<char>  order;
  std::promise<void> done;

  auto record = [&](char c) {
    std::lock_guard lock(mutex);
    order.push_back(c);
  };

  loop.ScheduleAfter(60ms, [&] {
    record('a');
    done.set_value();
  });
  loop.ScheduleAfter(20ms, [&] { record('b'); });
  const auto cancelled = loop.ScheduleAfter(40ms, [&] { record('x'); });
  loop.Cancel(cancelled);

  assert(done.get_future().wait_for(2s) == std::future_status::ready);
  loop.Stop();

  assert((order == std::vector<char>{'b', 'a'}));
}

void TestThrowingTaskDoesNotStopLoop() {
  EventLoop loop;
  loop.Start();

  std::promise<void> done;
  loop.Post([] { throw std::runtime_error("boom"); });
  loop.Post([&] { done.set_value(); });

  assert(done.get_future().wait_for(2s) == std::future_status::ready);
  loop.Stop();
}

void TestStoppedLoopRejectsWork() {
  EventLoop loop;
  loop.Start();
  loop.Stop();

  assert(!loop.Post([] {}));
  assert(loop.ScheduleAfter(10ms, [] {}) == EventLoop::kNoTimer);
}

void TestManualSchedulerRunsOnlyDueTimers() {
  ManualScheduler scheduler;
  std::vector<int> fired;

  scheduler.ScheduleAfter(100ms, [&] { fired.push_back(100); });
  scheduler.ScheduleAfter(300ms, [&] { fired.push_back(300); });

  scheduler.AdvanceBy(99ms);
  assert(fired.empty());

  scheduler.AdvanceBy(1ms);
  assert((fired == std::vector<int>{100}));
  assert(scheduler.PendingTimers() == 1);

  scheduler.AdvanceBy(500ms);
  assert((fired == std::vector<int>{100, 300}));
  assert(scheduler.Elapsed() == 600ms);
}

void TestManualSchedulerChainsFromFireTime() {
  ManualScheduler scheduler;
  std::vector<std::chrono::milliseconds> fired_at;

  scheduler.ScheduleAfter(100ms, [&] {
    fired_at.push_back(scheduler.Elapsed());
    scheduler.ScheduleAfter(100ms, [&] { fired_at.push_back(scheduler.Elapsed()); });
  });

  scheduler.AdvanceBy(250ms);
  assert(fired_at.size() == 2);
  assert(fired_at[0] == 100ms);
  assert(fired_at[1] == 200ms);
}

void TestManualSchedulerCancelAndPost() {
  ManualScheduler scheduler;
  int             count = 0;

  const auto id = scheduler.ScheduleAfter(10ms, [&] { ++count; });
  scheduler.Cancel(id);
  scheduler.Cancel(id);
  scheduler.AdvanceBy(20ms);
  assert(count == 0);

  scheduler.Post([&] { ++count; });
  assert(count == 0);
  scheduler.RunPending();
  assert(count == 1);
}

} // namespace

int main() {
  TestPostedTasksRunInOrder();
  TestTimersFireByDeadlineAndCancelWorks();
  TestThrowingTaskDoesNotStopLoop();
  TestStoppedLoopRejectsWork();
  TestManualSchedulerRunsOnlyDueTimers();
  TestManualSchedulerChainsFromFireTime();
  TestManualSchedulerCancelAndPost();

  std::cout << "shot_kiosk_unit_event_loop: pass\n";
  return 0;
}
