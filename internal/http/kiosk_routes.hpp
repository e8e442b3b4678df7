#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "internal/util/time.hpp"

namespace kiosk::capture {
class CaptureOrchestrator;
}
namespace kiosk::events {
class EventBroadcaster;
}
namespace kiosk::trigger {
class TriggerDispatcher;
}

namespace kiosk::http {

struct RoutesOptions {
  // Base of the returned image URLs. The images are served elsewhere.
  std::string               image_url_prefix  = "/images/";
  std::chrono::milliseconds sse_retry{2000};
  std::size_t               max_queued_events = 64;
  std::chrono::milliseconds heartbeat{15000};
};

/*
  HTTP surface of the kiosk.

    POST /capture  trigger a capture and wait for its result
    GET  /events   Server-Sent Events stream of notifications
    GET  /status   quota and phase snapshot

  Handlers run on connection threads and only touch the dispatcher, the
  broadcaster and the orchestrator's status snapshot.
*/
class KioskRoutes {
 public:
  KioskRoutes(RoutesOptions options, std::shared_ptr<kiosk::trigger::TriggerDispatcher> dispatcher,
              std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator,
              std::shared_ptr<kiosk::events::EventBroadcaster> broadcaster, kiosk::util::ClockFn clock = kiosk::util::Now);

  HttpResponse Handle(const HttpRequest& request);

  // Releases waiting capture requests and ends event streams.
  void Shutdown();

 private:
  HttpResponse Capture();
  HttpResponse Events();
  HttpResponse Status();

  std::string ImageUrl(const std::string& filename) const;

  RoutesOptions                                        options_;
  std::shared_ptr<kiosk::trigger::TriggerDispatcher>   dispatcher_;
  std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator_;
  std::shared_ptr<kiosk::events::EventBroadcaster>     broadcaster_;
  kiosk::util::ClockFn                                 clock_;

  std::shared_ptr<std::atomic<bool>> stopping_;
};

} // namespace kiosk::http
