#include "capture_orchestrator.hpp"

#include <exception>
#include <utility>

#include "config/config.pb.h"
#include "internal/display/display_presenter.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/quota_store.hpp"
#include "internal/util/errors.hpp"

namespace kiosk::capture {

using kiosk::model::CaptureOutcome;
using kiosk::model::CaptureRequest;
using kiosk::model::CaptureResult;
using kiosk::model::CaptureStatus;
using kiosk::model::DisplayPhase;
using kiosk::observability::BoolField;
using kiosk::observability::IntField;
using kiosk::observability::StringField;
using kiosk::runtime::Scheduler;

namespace {

constexpr const char* kTimedOutMessage = "Timed out";

std::string FailureMessage(const CaptureRequest& request, bool timed_out) {
  if (timed_out) return kTimedOutMessage;
  return request.source == kiosk::model::TriggerSource::kButton ? "Check camera" : "Capture failed";
}

std::chrono::milliseconds Millis(uint32_t value) {
  return std::chrono::milliseconds(value);
}

} // namespace

OrchestratorOptions OrchestratorOptions::FromConfig(const kiosk::runtime::config::OrchestratorConfig& config) {
  OrchestratorOptions options;
  options.countdown_seconds          = static_cast<int>(config.countdown_seconds());
  options.countdown_step             = Millis(config.countdown_step_ms());
  options.processing_min             = Millis(config.processing_min_ms());
  options.safety_timeout             = Millis(config.safety_timeout_ms());
  options.settle_delay               = Millis(config.settle_delay_ms());
  options.limit_message              = Millis(config.limit_message_ms());
  options.notify_on_failure          = config.notify_on_failure();
  options.release_busy_before_settle = config.release_busy_before_settle();
  return options;
}

CaptureOrchestrator::CaptureOrchestrator(OrchestratorOptions options, std::shared_ptr<Scheduler> scheduler,
                                         std::shared_ptr<kiosk::quota::QuotaStore>         quota,
                                         std::shared_ptr<kiosk::display::DisplayPresenter> presenter, CapturerPtr capturer,
                                         std::shared_ptr<kiosk::events::EventBroadcaster> broadcaster)
    : options_(std::move(options)),
      scheduler_(std::move(scheduler)),
      quota_(std::move(quota)),
      presenter_(std::move(presenter)),
      capturer_(std::move(capturer)),
      broadcaster_(std::move(broadcaster)) {
  status_.daily_limit = quota_->DailyLimit();
}

void CaptureOrchestrator::Start() {
  quota_record_ = quota_->Load();
  KIOSK_LOG_INFO("Quota loaded", {StringField("date", quota_record_.date()), IntField("shots_remaining", quota_record_.shots_remaining()),
                                  IntField("daily_limit", quota_->DailyLimit())});
  ShowIdle();
}

bool CaptureOrchestrator::TryAcquire() {
  bool expected = false;
  return busy_.compare_exchange_strong(expected, true);
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

void CaptureOrchestrator::Run(CaptureRequest request, CompletionCallback done) {
  if (!busy_.load()) {
    KIOSK_LOG_WARN("Run called without acquiring busy", {StringField("source", kiosk::model::SourceName(request.source))});
    busy_.store(true);
  }

  if (limit_revert_timer_ != Scheduler::kNoTimer) {
    scheduler_->Cancel(limit_revert_timer_);
    limit_revert_timer_ = Scheduler::kNoTimer;
  }

  bool allowed = false;
  try {
    allowed = quota_->CanCapture(quota_record_);
  } catch (const kiosk::util::PersistenceError& e) {
    KIOSK_LOG_ERROR("Quota write failed", {StringField("error", e.what())});
    allowed = quota_record_.shots_remaining() > 0;
  }

  if (!allowed) {
    RejectLimitReached(done);
    return;
  }

  const auto generation = ++generation_;

  ActiveRun run;
  run.generation = generation;
  run.request    = request;
  run.done       = std::move(done);
  run_           = std::move(run);

  KIOSK_LOG_INFO("Capture accepted", {StringField("source", kiosk::model::SourceName(request.source)),
                                      IntField("generation", static_cast<std::int64_t>(generation)),
                                      IntField("shots_remaining", quota_record_.shots_remaining())});

  LaunchCapture(generation);

  std::weak_ptr<CaptureOrchestrator> weak = weak_from_this();
  run_->timeout_timer = scheduler_->ScheduleAfter(options_.safety_timeout, [weak, generation] {
    if (auto self = weak.lock()) self->OnSafetyTimeout(generation);
  });

  CountdownStep(generation, options_.countdown_seconds);
}

void CaptureOrchestrator::RejectLimitReached(const CompletionCallback& done) {
  KIOSK_LOG_INFO("Daily limit reached", {IntField("daily_limit", quota_->DailyLimit())});

  busy_.store(false);
  Show(DisplayPhase::LimitReached());

  std::weak_ptr<CaptureOrchestrator> weak = weak_from_this();
  limit_revert_timer_ = scheduler_->ScheduleAfter(options_.limit_message, [weak] {
    auto self = weak.lock();
    if (!self) return;
    self->limit_revert_timer_ = Scheduler::kNoTimer;
    if (!self->run_) self->ShowIdle();
  });

  CaptureResult result;
  result.status = CaptureStatus::kLimitReached;
  result.error  = "Daily limit reached";
  Complete(done, result);
}

void CaptureOrchestrator::LaunchCapture(std::uint64_t generation) {
  std::weak_ptr<CaptureOrchestrator> weak      = weak_from_this();
  std::shared_ptr<Scheduler>         scheduler = scheduler_;

  auto on_settled = [weak, scheduler, generation](CaptureOutcome outcome) {
    scheduler->Post([weak, generation, outcome = std::move(outcome)]() mutable {
      if (auto self = weak.lock()) self->OnCaptureSettled(generation, std::move(outcome));
    });
  };

  try {
    capturer_->Capture(on_settled);
  } catch (const std::exception& e) {
    KIOSK_LOG_ERROR("Capturer threw", {StringField("error", e.what())});
    on_settled(CaptureOutcome::Failed(e.what()));
  }
}

// ------------------------------------------------------------
// Phases
// ------------------------------------------------------------

void CaptureOrchestrator::CountdownStep(std::uint64_t generation, int remaining) {
  if (!IsCurrent(generation)) return;

  Show(DisplayPhase::Countdown(remaining));

  std::weak_ptr<CaptureOrchestrator> weak = weak_from_this();
  scheduler_->ScheduleAfter(options_.countdown_step, [weak, generation, remaining] {
    auto self = weak.lock();
    if (!self) return;
    if (remaining > 1) {
      self->CountdownStep(generation, remaining - 1);
    } else {
      self->EnterProcessing(generation);
    }
  });
}

void CaptureOrchestrator::EnterProcessing(std::uint64_t generation) {
  if (!IsCurrent(generation)) return;

  Show(DisplayPhase::Processing());

  std::weak_ptr<CaptureOrchestrator> weak = weak_from_this();
  scheduler_->ScheduleAfter(options_.processing_min, [weak, generation] {
    if (auto self = weak.lock()) self->OnProcessingElapsed(generation);
  });
}

void CaptureOrchestrator::OnProcessingElapsed(std::uint64_t generation) {
  if (!IsCurrent(generation)) return;

  run_->processing_elapsed = true;
  MaybeFinish();
}

void CaptureOrchestrator::OnCaptureSettled(std::uint64_t generation, CaptureOutcome outcome) {
  if (!run_ || run_->generation != generation || run_->outcome) {
    KIOSK_LOG_WARN("Discarding stale capture result", {IntField("generation", static_cast<std::int64_t>(generation)),
                                                       IntField("current", static_cast<std::int64_t>(generation_)),
                                                       BoolField("success", outcome.success)});
    return;
  }

  scheduler_->Cancel(run_->timeout_timer);
  run_->timeout_timer = Scheduler::kNoTimer;

  if (outcome.success && !outcome.filename) {
    outcome = CaptureOutcome::Failed("capturer reported success without a filename");
  }

  KIOSK_LOG_DEBUG("Capture settled", {IntField("generation", static_cast<std::int64_t>(generation)), BoolField("success", outcome.success)});

  run_->outcome = std::move(outcome);
  MaybeFinish();
}

void CaptureOrchestrator::OnSafetyTimeout(std::uint64_t generation) {
  if (!IsCurrent(generation) || run_->outcome) return;

  KIOSK_LOG_ERROR("Capture timed out", {IntField("generation", static_cast<std::int64_t>(generation)),
                                        IntField("timeout_ms", options_.safety_timeout.count())});

  run_->timeout_timer = Scheduler::kNoTimer;
  run_->timed_out     = true;
  run_->outcome       = CaptureOutcome::Failed("capture timed out");
  MaybeFinish();
}

void CaptureOrchestrator::MaybeFinish() {
  if (!run_ || run_->finished) return;
  if (!run_->processing_elapsed || !run_->outcome) return;
  Finish();
}

void CaptureOrchestrator::Finish() {
  run_->finished = true;

  const auto&   outcome = *run_->outcome;
  CaptureResult result;

  if (outcome.success) {
    result.status   = CaptureStatus::kCaptured;
    result.filename = *outcome.filename;

    try {
      quota_->Decrement(quota_record_);
    } catch (const kiosk::util::PersistenceError& e) {
      KIOSK_LOG_ERROR("Quota write failed", {StringField("error", e.what())});
    }

    KIOSK_LOG_INFO("Capture saved", {StringField("filename", result.filename), IntField("shots_remaining", quota_record_.shots_remaining())});

    Show(DisplayPhase::Result(true));
    Notify([&] { broadcaster_->PublishCaptured(result.filename); });
  } else {
    result.status = CaptureStatus::kFailed;
    result.error  = outcome.error.value_or("capture failed");

    KIOSK_LOG_ERROR("Capture failed", {StringField("source", kiosk::model::SourceName(run_->request.source)), StringField("error", result.error)});

    Show(DisplayPhase::Result(false, FailureMessage(run_->request, run_->timed_out)));
    if (options_.notify_on_failure) Notify([&] { broadcaster_->PublishFailed(); });
  }

  Complete(run_->done, result);

  const auto generation = run_->generation;
  if (options_.release_busy_before_settle) {
    busy_.store(false);
    PublishStatus();
  }

  std::weak_ptr<CaptureOrchestrator> weak = weak_from_this();
  scheduler_->ScheduleAfter(options_.settle_delay, [weak, generation] {
    if (auto self = weak.lock()) self->ReturnToIdle(generation);
  });
}

void CaptureOrchestrator::ReturnToIdle(std::uint64_t generation) {
  if (!IsCurrent(generation)) {
    KIOSK_LOG_DEBUG("Ignoring stale settle timer", {IntField("generation", static_cast<std::int64_t>(generation))});
    return;
  }

  run_.reset();
  ShowIdle();
  busy_.store(false);
  PublishStatus();
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

void CaptureOrchestrator::ShowIdle() {
  try {
    quota_->EnsureToday(quota_record_);
  } catch (const kiosk::util::PersistenceError& e) {
    KIOSK_LOG_ERROR("Quota write failed", {StringField("error", e.what())});
  }
  Show(DisplayPhase::Idle(quota_record_.shots_remaining()));
}

void CaptureOrchestrator::Show(const DisplayPhase& phase) {
  presenter_->Show(phase);
  PublishStatus();
}

void CaptureOrchestrator::Complete(const CompletionCallback& done, const CaptureResult& result) {
  if (!done) return;
  try {
    done(result);
  } catch (const std::exception& e) {
    KIOSK_LOG_ERROR("Completion callback failed", {StringField("status", kiosk::model::StatusName(result.status)), StringField("error", e.what())});
  }
}

void CaptureOrchestrator::Notify(const std::function<void()>& publish) {
  try {
    publish();
  } catch (const std::exception& e) {
    KIOSK_LOG_ERROR("Notification failed", {StringField("error", e.what())});
  }
}

bool CaptureOrchestrator::IsCurrent(std::uint64_t generation) const {
  return run_ && run_->generation == generation;
}

void CaptureOrchestrator::PublishStatus() {
  std::lock_guard lock(status_mutex_);
  status_.phase           = presenter_->Current().kind;
  status_.busy            = busy_.load();
  status_.shots_remaining = quota_record_.shots_remaining();
}

OrchestratorStatus CaptureOrchestrator::Status() const {
  std::lock_guard lock(status_mutex_);
  OrchestratorStatus snapshot = status_;
  snapshot.busy               = busy_.load();
  return snapshot;
}

} // namespace kiosk::capture
