#include "kiosk_routes.hpp"

#include <google/protobuf/struct.pb.h>

#include <future>
#include <utility>

#include "internal/capture/capture_orchestrator.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/events/sse_channel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/trigger/trigger_dispatcher.hpp"

namespace kiosk::http {

using kiosk::model::CaptureResult;
using kiosk::model::CaptureStatus;
using kiosk::observability::IntField;
using kiosk::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{200};

HttpResponse MethodNotAllowed(const char* allow) {
  auto response             = HttpResponse::Error(405, "Method not allowed");
  response.headers["Allow"] = allow;
  return response;
}

void SetField(google::protobuf::Struct& body, const std::string& key, double value) {
  (*body.mutable_fields())[key].set_number_value(value);
}

void SetField(google::protobuf::Struct& body, const std::string& key, bool value) {
  (*body.mutable_fields())[key].set_bool_value(value);
}

void SetField(google::protobuf::Struct& body, const std::string& key, const std::string& value) {
  (*body.mutable_fields())[key].set_string_value(value);
}

} // namespace

KioskRoutes::KioskRoutes(RoutesOptions options, std::shared_ptr<kiosk::trigger::TriggerDispatcher> dispatcher,
                         std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator,
                         std::shared_ptr<kiosk::events::EventBroadcaster> broadcaster, kiosk::util::ClockFn clock)
    : options_(std::move(options)),
      dispatcher_(std::move(dispatcher)),
      orchestrator_(std::move(orchestrator)),
      broadcaster_(std::move(broadcaster)),
      clock_(std::move(clock)),
      stopping_(std::make_shared<std::atomic<bool>>(false)) {
}

HttpResponse KioskRoutes::Handle(const HttpRequest& request) {
  if (request.path == "/capture") {
    if (request.method != "POST") return MethodNotAllowed("POST");
    return Capture();
  }
  if (request.path == "/events") {
    if (request.method != "GET") return MethodNotAllowed("GET");
    return Events();
  }
  if (request.path == "/status") {
    if (request.method != "GET") return MethodNotAllowed("GET");
    return Status();
  }
  return HttpResponse::Error(404, "Not found");
}

void KioskRoutes::Shutdown() {
  stopping_->store(true);
}

// ------------------------------------------------------------
// POST /capture
// ------------------------------------------------------------

HttpResponse KioskRoutes::Capture() {
  auto promise = std::make_shared<std::promise<CaptureResult>>();
  auto future  = promise->get_future();

  dispatcher_->Submit(kiosk::model::TriggerSource::kHttp, [promise](const CaptureResult& result) { promise->set_value(result); });

  while (future.wait_for(kWaitSlice) != std::future_status::ready) {
    if (stopping_->load()) return HttpResponse::Error(503, "Shutting down");
  }

  const auto result = future.get();
  switch (result.status) {
    case CaptureStatus::kCaptured: {
      google::protobuf::Struct body;
      SetField(body, "ok", true);
      SetField(body, "url", ImageUrl(result.filename));
      SetField(body, "saved", result.filename);
      return HttpResponse::Json(200, body);
    }
    case CaptureStatus::kBusy:
      return HttpResponse::Error(409, "Busy");
    case CaptureStatus::kLimitReached:
      return HttpResponse::Error(403, "Daily limit reached");
    case CaptureStatus::kFailed:
      break;
  }
  return HttpResponse::Error(500, "Capture failed");
}

std::string KioskRoutes::ImageUrl(const std::string& filename) const {
  return options_.image_url_prefix + filename + "?ts=" + std::to_string(kiosk::util::ToUnixMillis(clock_()));
}

// ------------------------------------------------------------
// GET /events
// ------------------------------------------------------------

HttpResponse KioskRoutes::Events() {
  HttpResponse response;
  response.content_type             = "text/event-stream";
  response.headers["Cache-Control"] = "no-store";

  auto broadcaster = broadcaster_;
  auto stopping    = stopping_;
  auto options     = options_;

  response.stream = [broadcaster, stopping, options](StreamWriter& writer) {
    auto       channel = std::make_shared<kiosk::events::SseChannel>(options.max_queued_events);
    const auto id      = broadcaster->Subscribe(channel);

    bool open  = writer.Write("retry: " + std::to_string(options.sse_retry.count()) + "\n\n");
    auto quiet = std::chrono::milliseconds::zero();

    while (open && !stopping->load()) {
      auto frame = channel->Next(kWaitSlice);
      if (frame) {
        open  = writer.Write(*frame);
        quiet = std::chrono::milliseconds::zero();
        continue;
      }
      // SSE comment line as heartbeat
      quiet += kWaitSlice;
      if (quiet >= options.heartbeat) {
        open  = writer.Write(":\n\n");
        quiet = std::chrono::milliseconds::zero();
      }
    }

    channel->Close();
    broadcaster->Unsubscribe(id);
    if (channel->Dropped() > 0) {
      KIOSK_LOG_WARN("Event listener fell behind", {IntField("channel", static_cast<std::int64_t>(id)),
                                                    IntField("dropped", static_cast<std::int64_t>(channel->Dropped()))});
    }
  };
  return response;
}

// ------------------------------------------------------------
// GET /status
// ------------------------------------------------------------

HttpResponse KioskRoutes::Status() {
  const auto status = orchestrator_->Status();

  google::protobuf::Struct body;
  SetField(body, "ok", true);
  SetField(body, "shotsRemaining", static_cast<double>(status.shots_remaining));
  SetField(body, "dailyLimit", static_cast<double>(status.daily_limit));
  SetField(body, "busy", status.busy);
  SetField(body, "phase", std::string(kiosk::model::PhaseName(status.phase)));
  return HttpResponse::Json(200, body);
}

} // namespace kiosk::http
