#include "factory.hpp"

#include <future>
#include <stdexcept>
#include <string>

#include "internal/capture/capture_orchestrator.hpp"
#include "internal/capture/command_capturer.hpp"
#include "internal/display/display_presenter.hpp"
#include "internal/display/idle_animation.hpp"
#include "internal/display/layout.hpp"
#include "internal/display/log_display_driver.hpp"
#include "internal/display/pipe_display_driver.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/http/kiosk_routes.hpp"
#include "internal/input/sysfs_button_input.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/quota_store.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/trigger/trigger_dispatcher.hpp"

namespace kiosk::factory {

using namespace kiosk;

namespace {

display::DisplayDriverPtr BuildDisplayDriver(const runtime::config::DisplayConfig& config) {
  if (config.driver() == "log") {
    return std::make_shared<display::LogDisplayDriver>();
  }
  if (config.driver() == "pipe") {
    return std::make_shared<display::PipeDisplayDriver>(config.helper_command(), std::chrono::milliseconds(config.command_timeout_ms()));
  }
  throw std::runtime_error("unknown display driver: " + config.driver());
}

std::shared_ptr<display::DisplayPresenter> BuildPresenter(const runtime::config::RuntimeConfig& config,
                                                          std::shared_ptr<runtime::Scheduler>   scheduler) {
  const auto&     display = config.display();
  display::Layout layout(static_cast<int>(display.width()), static_cast<int>(display.height()));

  std::unique_ptr<display::IdleAnimation> animation;
  if (!display.animation().disabled()) {
    animation = display::MakeIdleAnimation(display.animation(), layout.Width(), layout.Height(),
                                           layout.IdleReservedRegions(config.quota().daily_limit()));
  }

  const auto tick_interval = std::chrono::milliseconds(1000 / display.animation().fps());

  return std::make_shared<display::DisplayPresenter>(BuildDisplayDriver(display), std::move(scheduler), std::move(layout),
                                                     std::move(animation), tick_interval);
}

http::RoutesOptions BuildRoutesOptions(const runtime::config::ServerConfig& config) {
  http::RoutesOptions options;
  options.image_url_prefix  = config.image_url_prefix();
  options.sse_retry         = std::chrono::milliseconds(config.sse_retry_ms());
  options.max_queued_events = config.max_queued_events();
  return options;
}

// Runs fn on the loop thread and waits for it.
template <typename Fn> void RunOnLoop(runtime::EventLoop& loop, Fn fn) {
  auto done   = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!loop.Post([fn, done] {
        fn();
        done->set_value();
      })) {
    return;
  }
  future.wait();
}

} // namespace

Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Runtime + leaves
  // ------------------------------------------------------------------
  app.loop        = std::make_shared<runtime::EventLoop>();
  app.quota       = std::make_shared<quota::QuotaStore>(config.quota().state_path(), config.quota().daily_limit());
  app.broadcaster = std::make_shared<events::EventBroadcaster>();
  app.capturer    = std::make_shared<capture::CommandCapturer>(config.capture());
  app.presenter   = BuildPresenter(config, app.loop);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.orchestrator = std::make_shared<capture::CaptureOrchestrator>(capture::OrchestratorOptions::FromConfig(config.orchestrator()),
                                                                    app.loop, app.quota, app.presenter, app.capturer, app.broadcaster);
  app.dispatcher   = std::make_shared<trigger::TriggerDispatcher>(app.loop, app.orchestrator);

  // ------------------------------------------------------------------
  // Boundaries
  // ------------------------------------------------------------------
  app.routes = std::make_shared<http::KioskRoutes>(BuildRoutesOptions(config.server()), app.dispatcher, app.orchestrator, app.broadcaster);

  if (config.button().enabled()) {
    app.button = std::make_unique<input::SysfsButtonInput>(config.button());
    app.button->OnEdge([dispatcher = app.dispatcher] { dispatcher->OnButtonEdge(); });
  }

  return app;
}

void Start(Application& app) {
  app.loop->Start();

  // a failure here is logged by the loop; the kiosk still serves HTTP
  app.loop->Post([orchestrator = app.orchestrator] { orchestrator->Start(); });

  if (app.button) {
    app.button->Start();
  }
}

void Stop(Application& app) {
  if (app.button) app.button->Stop();
  app.routes->Shutdown();
  app.capturer->Stop();
  RunOnLoop(*app.loop, [presenter = app.presenter] { presenter->Shutdown(); });
  app.loop->Stop();
}

} // namespace kiosk::factory
