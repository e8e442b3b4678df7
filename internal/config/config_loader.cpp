#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace kiosk::config {

using kiosk::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultCaptureCommand =
    "rpicam-still -n -t 1 -o - | convert - -resize '1024x1024>' -colorspace Gray -auto-level "
    "-contrast-stretch 0.5%x0.5% -define webp:lossless=false -quality 80 -define webp:method=6 "
    "-define webp:target-size=100000 {output}";

void AddRegion(kiosk::runtime::config::AnimationConfig* animation, uint32_t x0, uint32_t y0, uint32_t x1, uint32_t y1) {
  auto* region = animation->add_safe_regions();
  region->set_x0(x0);
  region->set_y0(y0);
  region->set_x1(x1);
  region->set_y1(y1);
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument("Invalid configuration: " + message);
  }
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // An empty document means "all defaults".
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (!server->has_enabled()) server->set_enabled(true);
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0");
  if (server->port() == 0) server->set_port(3000);
  if (server->image_url_prefix().empty()) server->set_image_url_prefix("/images/");
  if (server->sse_retry_ms() == 0) server->set_sse_retry_ms(2000);
  if (server->max_queued_events() == 0) server->set_max_queued_events(64);

  auto* quota = config->mutable_quota();
  if (quota->daily_limit() == 0) quota->set_daily_limit(10);
  if (quota->state_path().empty()) quota->set_state_path("state.json");

  auto* capture = config->mutable_capture();
  if (capture->command().empty()) capture->set_command(kDefaultCaptureCommand);
  if (capture->output_dir().empty()) capture->set_output_dir("images");
  if (capture->filename_prefix().empty()) capture->set_filename_prefix("capture_");
  if (capture->extension().empty()) capture->set_extension(".webp");
  if (capture->command_timeout_ms() == 0) capture->set_command_timeout_ms(15000);

  auto* orchestrator = config->mutable_orchestrator();
  if (orchestrator->countdown_seconds() == 0) orchestrator->set_countdown_seconds(3);
  if (orchestrator->countdown_step_ms() == 0) orchestrator->set_countdown_step_ms(1000);
  if (orchestrator->processing_min_ms() == 0) orchestrator->set_processing_min_ms(2000);
  if (orchestrator->safety_timeout_ms() == 0) orchestrator->set_safety_timeout_ms(30000);
  if (orchestrator->settle_delay_ms() == 0) orchestrator->set_settle_delay_ms(800);
  if (orchestrator->limit_message_ms() == 0) orchestrator->set_limit_message_ms(1500);

  auto* display = config->mutable_display();
  if (display->driver().empty()) display->set_driver("log");
  if (display->command_timeout_ms() == 0) display->set_command_timeout_ms(500);
  if (display->width() == 0) display->set_width(128);
  if (display->height() == 0) display->set_height(64);
  if (display->helper_command().empty()) {
    display->set_helper_command(std::string("python3 ") + KIOSK_DISPLAY_HELPER + " --width " + std::to_string(display->width()) +
                                " --height " + std::to_string(display->height()));
  }

  auto* animation = display->mutable_animation();
  if (animation->variant().empty()) animation->set_variant("flicker");
  if (animation->fps() == 0) animation->set_fps(5);
  if (animation->point_count() == 0) animation->set_point_count(10);
  if (animation->toggle_probability() == 0.0) animation->set_toggle_probability(0.5);
  if (animation->relocate_every_ms() == 0) animation->set_relocate_every_ms(3000);
  if (animation->relocate_fraction() == 0.0) animation->set_relocate_fraction(0.2);
  if (animation->safe_regions_size() == 0) {
    // top-right and bottom-left corners of a 128x64 panel
    AddRegion(animation, 104, 0, 127, 15);
    AddRegion(animation, 0, 48, 27, 63);
  }
  if (animation->orbit_radius() == 0) animation->set_orbit_radius(25);
  if (animation->orbit_steps() == 0) animation->set_orbit_steps(36);

  auto* button = config->mutable_button();
  if (!button->has_enabled()) button->set_enabled(true);
  if (button->gpio() == 0) button->set_gpio(17);
  if (button->sysfs_root().empty()) button->set_sysfs_root("/sys/class/gpio");
  if (button->debounce_ms() == 0) button->set_debounce_ms(10);
  if (button->poll_interval_ms() == 0) button->set_poll_interval_ms(2);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  Require(config.server().port() <= 65535, "server.port out of range");
  Require(config.quota().daily_limit() > 0, "quota.daily_limit must be positive");
  Require(!config.quota().state_path().empty(), "quota.state_path is required");
  Require(config.capture().command().find("{output}") != std::string::npos, "capture.command must contain {output}");

  const auto& orchestrator = config.orchestrator();
  Require(orchestrator.countdown_seconds() > 0, "orchestrator.countdown_seconds must be positive");
  Require(orchestrator.countdown_step_ms() > 0, "orchestrator.countdown_step_ms must be positive");
  Require(orchestrator.safety_timeout_ms() > 0, "orchestrator.safety_timeout_ms must be positive");

  const auto& display = config.display();
  Require(display.driver() == "log" || display.driver() == "pipe", "display.driver must be 'log' or 'pipe'");
  Require(display.width() > 0 && display.height() > 0, "display geometry must be non-zero");

  const auto& animation = display.animation();
  Require(animation.variant() == "flicker" || animation.variant() == "orbit", "display.animation.variant must be 'flicker' or 'orbit'");
  Require(animation.fps() > 0 && animation.fps() <= 60, "display.animation.fps must be in [1, 60]");
  Require(animation.toggle_probability() >= 0.0 && animation.toggle_probability() <= 1.0,
          "display.animation.toggle_probability must be in [0, 1]");
  Require(animation.relocate_fraction() >= 0.0 && animation.relocate_fraction() <= 1.0,
          "display.animation.relocate_fraction must be in [0, 1]");
  for (const auto& region : animation.safe_regions()) {
    Require(region.x0() <= region.x1() && region.y0() <= region.y1(), "display.animation.safe_regions has an inverted region");
  }

  Require(config.button().debounce_ms() < 1000, "button.debounce_ms must be below one second");
}

} // namespace kiosk::config
