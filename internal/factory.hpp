#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/input/button_input.hpp"

namespace kiosk::runtime {
class EventLoop;
}
namespace kiosk::quota {
class QuotaStore;
}
namespace kiosk::display {
class DisplayPresenter;
}
namespace kiosk::capture {
class CommandCapturer;
class CaptureOrchestrator;
}
namespace kiosk::events {
class EventBroadcaster;
}
namespace kiosk::trigger {
class TriggerDispatcher;
}
namespace kiosk::http {
class KioskRoutes;
}

namespace kiosk::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<kiosk::runtime::EventLoop>           loop;
  std::shared_ptr<kiosk::quota::QuotaStore>            quota;
  std::shared_ptr<kiosk::display::DisplayPresenter>    presenter;
  std::shared_ptr<kiosk::capture::CommandCapturer>     capturer;
  std::shared_ptr<kiosk::events::EventBroadcaster>     broadcaster;
  std::shared_ptr<kiosk::capture::CaptureOrchestrator> orchestrator;
  std::shared_ptr<kiosk::trigger::TriggerDispatcher>   dispatcher;
  std::shared_ptr<kiosk::http::KioskRoutes>            routes;

  // null when the button is disabled
  kiosk::input::ButtonInputPtr button;
};

/*
  Build

  Constructs the whole kiosk from runtime config. This is the
  composition root: the only place that knows concrete driver, capturer
  and input types. Nothing is started.
*/
Application Build(const kiosk::runtime::config::RuntimeConfig& config);

// Starts the event loop, draws the idle screen and arms the button.
void Start(Application& app);

// Reverse of Start(). Waits for in-flight capture commands and clears
// the panel.
void Stop(Application& app);

} // namespace kiosk::factory
