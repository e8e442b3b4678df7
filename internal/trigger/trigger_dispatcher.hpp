#pragma once

#include <memory>

#include "internal/capture/capture_orchestrator.hpp"
#include "internal/model/capture.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/util/time.hpp"

namespace kiosk::trigger {

/*
  Merges button presses and HTTP requests into capture requests.

  Acceptance is a single check-and-set on the orchestrator's busy flag.
  A rejected trigger is answered with Busy on the caller's thread and
  changes nothing else. Accepted requests run on the scheduler thread.
*/
class TriggerDispatcher {
 public:
  TriggerDispatcher(std::shared_ptr<kiosk::runtime::Scheduler> scheduler, std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator,
                    kiosk::util::ClockFn clock = kiosk::util::Now);

  // Any thread. done is invoked exactly once.
  void Submit(kiosk::model::TriggerSource source, kiosk::capture::CompletionCallback done);

  // Button presses have nobody to answer; the result is logged.
  void OnButtonEdge();

 private:
  std::shared_ptr<kiosk::runtime::Scheduler>           scheduler_;
  std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator_;
  kiosk::util::ClockFn                                 clock_;
};

} // namespace kiosk::trigger
