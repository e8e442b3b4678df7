#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/http/kiosk_routes.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using kiosk::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: shot-kiosk <config.yaml> OR shot-kiosk --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = kiosk::config::ConfigLoader::LoadFromYaml(config_path);

    kiosk::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = kiosk::factory::Build(config);

    // ------------------------------------------------------------
    // Start
    // ------------------------------------------------------------
    std::unique_ptr<Server> server;
    if (config.server().enabled()) {
      server = std::make_unique<Server>(config.server().bind_address(), static_cast<std::uint16_t>(config.server().port()),
                                        [routes = app.routes](const kiosk::http::HttpRequest& request) { return routes->Handle(request); });
    }

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    // peers closing an event stream must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    kiosk::factory::Start(app);
    try {
      if (server) server->Start();
    } catch (const std::exception&) {
      // the loop thread and its timers must not outlive the components
      kiosk::factory::Stop(app);
      throw;
    }

    KIOSK_LOG_INFO("Shot kiosk started", {kiosk::observability::IntField("daily_limit", config.quota().daily_limit()),
                                          kiosk::observability::StringField("display", config.display().driver())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    KIOSK_LOG_INFO("Shutting down shot kiosk");

    app.routes->Shutdown();
    if (server) server->Stop();
    kiosk::factory::Stop(app);
    kiosk::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    KIOSK_LOG_ERROR("Fatal error", {kiosk::observability::StringField("error", e.what())});
    kiosk::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
