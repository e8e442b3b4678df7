#pragma once

#include <chrono>
#include <optional>

namespace kiosk::input {

/*
  Glitch filter for a sampled level. A change is only accepted once the
  new level has been observed for at least the filter window; shorter
  pulses are ignored.
*/
class Debouncer {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit Debouncer(std::chrono::milliseconds window) : window_(window) {
  }

  // Returns true exactly once per accepted released → pressed change.
  bool Update(bool pressed, TimePoint now) {
    if (pressed == stable_) {
      candidate_since_.reset();
      return false;
    }

    if (!candidate_since_) {
      candidate_since_ = now;
    }
    if (now - *candidate_since_ < window_) return false;

    stable_ = pressed;
    candidate_since_.reset();
    return stable_;
  }

  bool Pressed() const {
    return stable_;
  }

 private:
  std::chrono::milliseconds window_;
  bool                      stable_ = false;
  std::optional<TimePoint>  candidate_since_;
};

} // namespace kiosk::input
