#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "capturer.hpp"
#include "internal/model/capture.hpp"
#include "internal/model/display_phase.hpp"
#include "internal/runtime/scheduler.hpp"
#include "kiosk/v1.hpp"

namespace kiosk::runtime::config {
class OrchestratorConfig;
}
namespace kiosk::quota {
class QuotaStore;
}
namespace kiosk::display {
class DisplayPresenter;
}
namespace kiosk::events {
class EventBroadcaster;
}

namespace kiosk::capture {

struct OrchestratorOptions {
  int                       countdown_seconds = 3;
  std::chrono::milliseconds countdown_step{1000};
  std::chrono::milliseconds processing_min{2000};
  std::chrono::milliseconds safety_timeout{30000};
  std::chrono::milliseconds settle_delay{800};
  std::chrono::milliseconds limit_message{1500};
  bool                      notify_on_failure          = false;
  bool                      release_busy_before_settle = false;

  static OrchestratorOptions FromConfig(const kiosk::runtime::config::OrchestratorConfig& config);
};

struct OrchestratorStatus {
  kiosk::model::PhaseKind phase           = kiosk::model::PhaseKind::kIdle;
  bool                    busy            = false;
  int                     shots_remaining = 0;
  uint32_t                daily_limit     = 0;
};

using CompletionCallback = std::function<void(const kiosk::model::CaptureResult&)>;

/*
  The capture state machine.

      Idle → Countdown(N..1) → Processing → Result → (settle) → Idle

  The capture is launched the moment a request is accepted and runs
  concurrently with the fixed countdown and minimum processing display.
  Its outcome is only looked at once both have elapsed, raced against a
  safety timeout measured from launch.

  Every run carries a generation number. Capture results and timers from
  an older generation, or results arriving after the timeout decided the
  run, are logged and dropped.

  The busy flag is taken by TryAcquire() (any thread) and released when
  Idle has been restored, or at Result when release_busy_before_settle is
  set. Everything else runs on the scheduler's thread.
*/
class CaptureOrchestrator : public std::enable_shared_from_this<CaptureOrchestrator> {
 public:
  CaptureOrchestrator(OrchestratorOptions options, std::shared_ptr<kiosk::runtime::Scheduler> scheduler,
                      std::shared_ptr<kiosk::quota::QuotaStore> quota, std::shared_ptr<kiosk::display::DisplayPresenter> presenter,
                      CapturerPtr capturer, std::shared_ptr<kiosk::events::EventBroadcaster> broadcaster);

  // Loads the quota and draws the idle screen.
  void Start();

  // Single atomic check-and-set; false means a run is active.
  bool TryAcquire();

  // Serves one accepted request. done is invoked exactly once.
  void Run(kiosk::model::CaptureRequest request, CompletionCallback done);

  bool Busy() const {
    return busy_.load();
  }

  // Safe from any thread.
  OrchestratorStatus Status() const;

  const kiosk::v1::QuotaRecord& Quota() const {
    return quota_record_;
  }

  std::uint64_t Generation() const {
    return generation_;
  }

 private:
  struct ActiveRun {
    std::uint64_t                               generation = 0;
    kiosk::model::CaptureRequest                request;
    CompletionCallback                          done;
    std::optional<kiosk::model::CaptureOutcome> outcome;
    bool                                        timed_out          = false;
    bool                                        processing_elapsed = false;
    bool                                        finished           = false;
    kiosk::runtime::Scheduler::TimerId          timeout_timer      = kiosk::runtime::Scheduler::kNoTimer;
  };

  void RejectLimitReached(const CompletionCallback& done);
  void LaunchCapture(std::uint64_t generation);

  void CountdownStep(std::uint64_t generation, int remaining);
  void EnterProcessing(std::uint64_t generation);
  void OnProcessingElapsed(std::uint64_t generation);
  void OnCaptureSettled(std::uint64_t generation, kiosk::model::CaptureOutcome outcome);
  void OnSafetyTimeout(std::uint64_t generation);

  void MaybeFinish();
  void Finish();
  void ReturnToIdle(std::uint64_t generation);

  void ShowIdle();
  void Show(const kiosk::model::DisplayPhase& phase);
  void Complete(const CompletionCallback& done, const kiosk::model::CaptureResult& result);
  void Notify(const std::function<void()>& publish);
  bool IsCurrent(std::uint64_t generation) const;
  void PublishStatus();

  OrchestratorOptions                               options_;
  std::shared_ptr<kiosk::runtime::Scheduler>        scheduler_;
  std::shared_ptr<kiosk::quota::QuotaStore>         quota_;
  std::shared_ptr<kiosk::display::DisplayPresenter> presenter_;
  CapturerPtr                                       capturer_;
  std::shared_ptr<kiosk::events::EventBroadcaster>  broadcaster_;

  std::atomic<bool> busy_{false};

  // scheduler thread only
  kiosk::v1::QuotaRecord             quota_record_;
  std::uint64_t                      generation_ = 0;
  std::optional<ActiveRun>           run_;
  kiosk::runtime::Scheduler::TimerId limit_revert_timer_ = kiosk::runtime::Scheduler::kNoTimer;

  mutable std::mutex status_mutex_;
  OrchestratorStatus status_;
};

} // namespace kiosk::capture
