#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using kiosk::config::ConfigLoader;
using kiosk::runtime::config::RuntimeConfig;

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "shot_kiosk_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Exception, typename Fn> bool Throws(Fn fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().enabled());
  assert(config.server().port() == 3000);
  assert(config.server().sse_retry_ms() == 2000);
  assert(config.quota().daily_limit() == 10);
  assert(config.quota().state_path() == "state.json");
  assert(config.capture().command().find("{output}") != std::string::npos);
  assert(config.capture().command_timeout_ms() == 15000);
  assert(config.orchestrator().countdown_seconds() == 3);
  assert(config.orchestrator().countdown_step_ms() == 1000);
  assert(config.orchestrator().processing_min_ms() == 2000);
  assert(config.orchestrator().safety_timeout_ms() == 30000);
  assert(config.orchestrator().settle_delay_ms() == 800);
  assert(!config.orchestrator().notify_on_failure());
  assert(!config.orchestrator().release_busy_before_settle());
  assert(config.display().driver() == "log");
  assert(config.display().helper_command().rfind("python3 /", 0) == 0);
  assert(config.display().helper_command().find("/shot-kiosk/kiosk_display.py --width 128 --height 64") != std::string::npos);
  assert(config.display().animation().variant() == "flicker");
  assert(config.display().animation().fps() == 5);
  assert(config.display().animation().safe_regions_size() == 2);
  assert(config.button().gpio() == 17);
  assert(config.button().debounce_ms() == 10);
}

void TestExplicitValuesAreKept() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(server:
  enabled: false
  port: 8080
quota:
  daily_limit: 3
  state_path: "/tmp/kiosk/state.json"
orchestrator:
  countdown_seconds: 5
  notify_on_failure: true
display:
  driver: pipe
  width: 96
  animation:
    variant: orbit
    seed: 42
    safe_regions:
      - {x0: 0, y0: 50, x1: 10, y1: 63}
button:
  enabled: false
  active_high: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.server().enabled());
  assert(config.server().port() == 8080);
  assert(config.quota().daily_limit() == 3);
  assert(config.quota().state_path() == "/tmp/kiosk/state.json");
  assert(config.orchestrator().countdown_seconds() == 5);
  assert(config.orchestrator().notify_on_failure());
  assert(config.display().driver() == "pipe");
  // the default helper is told the canvas size
  assert(config.display().helper_command().find("--width 96 --height 64") != std::string::npos);
  assert(config.display().animation().variant() == "orbit");
  assert(config.display().animation().seed() == 42);
  assert(config.display().animation().safe_regions_size() == 1);
  assert(config.display().animation().safe_regions(0).y0() == 50);
  assert(!config.button().enabled());
  assert(config.button().active_high());
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(capture:
  filename_prefix: "2024"
  command: "cp /tmp/src.webp {output}"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.capture().filename_prefix() == "2024");
  assert(config.capture().command() == "cp /tmp/src.webp {output}");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  port: 3000
unknown_field: 123
)");

  const bool threw = Throws<std::runtime_error>([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  const bool threw = Throws<std::runtime_error>([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/shot-kiosk.yaml"); });
  assert(threw);
}

void TestInvalidValuesAreRejected() {
  const auto driver_path = WriteYaml("bad_driver", "display:\n  driver: spi\n");
  assert(Throws<std::invalid_argument>([&] { (void)ConfigLoader::LoadFromYaml(driver_path.string()); }));

  const auto variant_path = WriteYaml("bad_variant", "display:\n  animation:\n    variant: comet\n");
  assert(Throws<std::invalid_argument>([&] { (void)ConfigLoader::LoadFromYaml(variant_path.string()); }));

  const auto probability_path = WriteYaml("bad_probability", "display:\n  animation:\n    toggle_probability: 1.5\n");
  assert(Throws<std::invalid_argument>([&] { (void)ConfigLoader::LoadFromYaml(probability_path.string()); }));

  const auto command_path = WriteYaml("bad_command", "capture:\n  command: \"rpicam-still -o out.jpg\"\n");
  assert(Throws<std::invalid_argument>([&] { (void)ConfigLoader::LoadFromYaml(command_path.string()); }));

  const auto region_path = WriteYaml("inverted_region", "display:\n  animation:\n    safe_regions:\n      - {x0: 20, y0: 0, x1: 10, y1: 5}\n");
  assert(Throws<std::invalid_argument>([&] { (void)ConfigLoader::LoadFromYaml(region_path.string()); }));
}

void TestValidateRejectsZeroCountdown() {
  RuntimeConfig config;
  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);

  config.mutable_orchestrator()->set_countdown_seconds(0);
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(config); }));

  ConfigLoader::ApplyDefaults(&config);
  config.mutable_quota()->set_daily_limit(0);
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(config); }));
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestExplicitValuesAreKept();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestInvalidValuesAreRejected();
  TestValidateRejectsZeroCountdown();

  std::cout << "shot_kiosk_unit_config_loader: pass\n";
  return 0;
}
