#include "trigger_dispatcher.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace kiosk::trigger {

using kiosk::model::CaptureRequest;
using kiosk::model::CaptureResult;
using kiosk::model::CaptureStatus;
using kiosk::model::TriggerSource;
using kiosk::observability::StringField;

TriggerDispatcher::TriggerDispatcher(std::shared_ptr<kiosk::runtime::Scheduler>           scheduler,
                                     std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator, kiosk::util::ClockFn clock)
    : scheduler_(std::move(scheduler)), orchestrator_(std::move(orchestrator)), clock_(std::move(clock)) {
}

void TriggerDispatcher::Submit(TriggerSource source, kiosk::capture::CompletionCallback done) {
  if (!orchestrator_->TryAcquire()) {
    KIOSK_LOG_INFO("Capture rejected", {StringField("source", kiosk::model::SourceName(source)), StringField("reason", "busy")});
    CaptureResult result;
    result.status = CaptureStatus::kBusy;
    result.error  = "Busy";
    if (done) done(result);
    return;
  }

  CaptureRequest request;
  request.source      = source;
  request.accepted_at = clock_();

  auto orchestrator = orchestrator_;
  auto posted       = scheduler_->Post([orchestrator, request, done]() mutable { orchestrator->Run(request, std::move(done)); });
  if (!posted) {
    // shutting down; busy stays held so nothing else starts
    KIOSK_LOG_WARN("Capture dropped, scheduler stopped", {StringField("source", kiosk::model::SourceName(source))});
    CaptureResult result;
    result.status = CaptureStatus::kFailed;
    result.error  = "Shutting down";
    if (done) done(result);
  }
}

void TriggerDispatcher::OnButtonEdge() {
  Submit(TriggerSource::kButton, [](const CaptureResult& result) {
    KIOSK_LOG_INFO("Button capture finished",
                   {StringField("status", kiosk::model::StatusName(result.status)), StringField("filename", result.filename),
                    StringField("error", result.error)});
  });
}

} // namespace kiosk::trigger
