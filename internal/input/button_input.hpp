#pragma once

#include <functional>
#include <memory>

namespace kiosk::input {

/*
  Physical trigger. Delivers one callback per debounced press; releases
  are not reported.
*/
class ButtonInput {
 public:
  using EdgeCallback = std::function<void()>;

  virtual ~ButtonInput() = default;

  // Must be set before Start().
  virtual void OnEdge(EdgeCallback callback) = 0;

  // Returns false when the input is unavailable; the kiosk keeps running
  // with HTTP triggers only.
  virtual bool Start() = 0;
  virtual void Stop()  = 0;
};

using ButtonInputPtr = std::unique_ptr<ButtonInput>;

} // namespace kiosk::input
