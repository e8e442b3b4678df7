#include "sysfs_button_input.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <string>

#include "config/config.pb.h"
#include "debouncer.hpp"
#include "internal/observability/logging.hpp"

namespace kiosk::input {

using kiosk::observability::IntField;
using kiosk::observability::StringField;

namespace {

constexpr int                       kExportWaitAttempts = 20;
constexpr std::chrono::milliseconds kExportWaitStep{10};

bool WriteAttribute(const std::filesystem::path& path, const std::string& value) {
  std::ofstream out(path);
  if (!out) return false;
  out << value;
  out.flush();
  return static_cast<bool>(out);
}

} // namespace

SysfsButtonInput::SysfsButtonInput(const kiosk::runtime::config::ButtonConfig& config)
    : sysfs_root_(config.sysfs_root()),
      gpio_(config.gpio()),
      active_high_(config.active_high()),
      debounce_(config.debounce_ms()),
      poll_interval_(config.poll_interval_ms()) {
}

SysfsButtonInput::~SysfsButtonInput() {
  Stop();
}

void SysfsButtonInput::OnEdge(EdgeCallback callback) {
  on_edge_ = std::move(callback);
}

std::filesystem::path SysfsButtonInput::LineDirectory() const {
  return sysfs_root_ / ("gpio" + std::to_string(gpio_));
}

bool SysfsButtonInput::Start() {
  if (running_.load()) return true;

  if (!Prepare()) {
    KIOSK_LOG_WARN("Button unavailable, continuing without it",
                   {IntField("gpio", gpio_), StringField("path", LineDirectory().string())});
    return false;
  }

  running_.store(true);
  poller_ = std::thread([this] { PollLoop(); });

  KIOSK_LOG_INFO("Button ready", {IntField("gpio", gpio_), IntField("debounce_ms", debounce_.count()),
                                  StringField("active", active_high_ ? "high" : "low")});
  return true;
}

void SysfsButtonInput::Stop() {
  running_.store(false);
  if (poller_.joinable()) poller_.join();
  if (value_fd_ >= 0) {
    ::close(value_fd_);
    value_fd_ = -1;
  }
}

// ------------------------------------------------------------
// Line setup
// ------------------------------------------------------------

bool SysfsButtonInput::Prepare() {
  const auto line = LineDirectory();
  std::error_code ec;

  if (!std::filesystem::exists(line, ec)) {
    if (!WriteAttribute(sysfs_root_ / "export", std::to_string(gpio_))) {
      KIOSK_LOG_DEBUG("GPIO export failed", {StringField("path", (sysfs_root_ / "export").string())});
      return false;
    }
    // udev may take a moment to create the line directory
    for (int attempt = 0; attempt < kExportWaitAttempts && !std::filesystem::exists(line, ec); ++attempt) {
      std::this_thread::sleep_for(kExportWaitStep);
    }
  }

  if (!WriteAttribute(line / "direction", "in")) {
    KIOSK_LOG_DEBUG("GPIO direction not writable", {StringField("path", (line / "direction").string())});
  }

  value_fd_ = ::open((line / "value").c_str(), O_RDONLY | O_CLOEXEC);
  if (value_fd_ < 0) {
    KIOSK_LOG_DEBUG("GPIO value open failed", {StringField("path", (line / "value").string()), StringField("error", std::strerror(errno))});
    return false;
  }

  return ReadPressed().has_value();
}

std::optional<bool> SysfsButtonInput::ReadPressed() {
  char          level = 0;
  const ssize_t n     = ::pread(value_fd_, &level, 1, 0);
  if (n != 1 || (level != '0' && level != '1')) return std::nullopt;

  const bool high = level == '1';
  return high == active_high_;
}

// ------------------------------------------------------------
// Poller
// ------------------------------------------------------------

void SysfsButtonInput::PollLoop() {
  Debouncer debouncer(debounce_);
  bool      read_failing = false;

  while (running_.load()) {
    const auto pressed = ReadPressed();
    if (!pressed) {
      if (!read_failing) KIOSK_LOG_WARN("GPIO read failed", {IntField("gpio", gpio_)});
      read_failing = true;
    } else {
      read_failing = false;
      if (debouncer.Update(*pressed, std::chrono::steady_clock::now()) && on_edge_) {
        try {
          on_edge_();
        } catch (const std::exception& e) {
          KIOSK_LOG_ERROR("Button handler failed", {StringField("error", e.what())});
        }
      }
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

} // namespace kiosk::input
