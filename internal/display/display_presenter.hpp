#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "display_driver.hpp"
#include "idle_animation.hpp"
#include "internal/model/display_phase.hpp"
#include "internal/runtime/scheduler.hpp"
#include "layout.hpp"

namespace kiosk::display {

/*
  Renders display phases and runs the idle animation.

  The animation only runs while the phase is Idle. Leaving Idle (or
  redrawing it) first stops the tick timer and erases every lit point,
  synchronously, before any new content reaches the driver.

  Must be used from the scheduler's thread only, and owned by a
  shared_ptr: tick timers hold a weak reference, so a presenter destroyed
  with its animation running leaves only inert timers behind.
*/
class DisplayPresenter : public std::enable_shared_from_this<DisplayPresenter> {
 public:
  DisplayPresenter(DisplayDriverPtr driver, std::shared_ptr<kiosk::runtime::Scheduler> scheduler, Layout layout,
                   std::unique_ptr<IdleAnimation> animation, std::chrono::milliseconds tick_interval);

  void Show(const kiosk::model::DisplayPhase& phase);

  // Stops the animation and clears it from the panel.
  void Shutdown();

  const kiosk::model::DisplayPhase& Current() const {
    return current_;
  }

  bool AnimationRunning() const {
    return animating_;
  }

  // nullptr when the animation is disabled.
  const IdleAnimation* Animation() const {
    return animation_.get();
  }

 private:
  void StartAnimation();
  void StopAnimation();
  void ScheduleTick();
  void OnTick(std::uint64_t generation);

  void Present(const kiosk::model::DisplayPhase& phase);
  void Draw(const std::vector<Pixel>& pixels);

  DisplayDriverPtr                           driver_;
  std::shared_ptr<kiosk::runtime::Scheduler> scheduler_;
  Layout                                     layout_;
  std::unique_ptr<IdleAnimation>             animation_;
  std::chrono::milliseconds                  tick_interval_;

  kiosk::model::DisplayPhase          current_;
  bool                                animating_            = false;
  std::uint64_t                       animation_generation_ = 0;
  kiosk::runtime::Scheduler::TimerId  tick_timer_           = kiosk::runtime::Scheduler::kNoTimer;
};

} // namespace kiosk::display
