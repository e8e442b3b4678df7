#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <thread>

#include "button_input.hpp"

namespace kiosk::runtime::config {
class ButtonConfig;
}

namespace kiosk::input {

/*
  Button on a GPIO line exposed through the sysfs GPIO interface.

  The line is exported and set to input on Start(), then its value file
  is sampled every poll interval on a dedicated thread and run through a
  Debouncer. The edge callback runs on that thread.
*/
class SysfsButtonInput final : public ButtonInput {
 public:
  explicit SysfsButtonInput(const kiosk::runtime::config::ButtonConfig& config);
  ~SysfsButtonInput() override;

  void OnEdge(EdgeCallback callback) override;
  bool Start() override;
  void Stop() override;

  std::filesystem::path LineDirectory() const;

 private:
  bool                Prepare();
  std::optional<bool> ReadPressed();
  void                PollLoop();

  std::filesystem::path     sysfs_root_;
  std::uint32_t             gpio_;
  bool                      active_high_;
  std::chrono::milliseconds debounce_;
  std::chrono::milliseconds poll_interval_;

  EdgeCallback      on_edge_;
  int               value_fd_ = -1;
  std::atomic<bool> running_{false};
  std::thread       poller_;
};

} // namespace kiosk::input
