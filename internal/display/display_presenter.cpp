#include "display_presenter.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace kiosk::display {

using kiosk::model::DisplayPhase;
using kiosk::model::PhaseKind;
using kiosk::observability::StringField;

DisplayPresenter::DisplayPresenter(DisplayDriverPtr driver, std::shared_ptr<kiosk::runtime::Scheduler> scheduler, Layout layout,
                                   std::unique_ptr<IdleAnimation> animation, std::chrono::milliseconds tick_interval)
    : driver_(std::move(driver)),
      scheduler_(std::move(scheduler)),
      layout_(std::move(layout)),
      animation_(std::move(animation)),
      tick_interval_(tick_interval) {
}

void DisplayPresenter::Show(const DisplayPhase& phase) {
  if (!kiosk::model::CanTransition(current_.kind, phase.kind)) {
    KIOSK_LOG_WARN("Unexpected display transition",
                   {StringField("from", kiosk::model::PhaseName(current_.kind)), StringField("to", kiosk::model::PhaseName(phase.kind))});
  }

  // stop-and-clear always precedes new content
  StopAnimation();

  current_ = phase;
  Present(phase);

  if (phase.kind == PhaseKind::kIdle) {
    StartAnimation();
  }
}

void DisplayPresenter::Shutdown() {
  StopAnimation();
}

// ------------------------------------------------------------
// Animation lifecycle
// ------------------------------------------------------------

void DisplayPresenter::StartAnimation() {
  if (!animation_ || animating_) return;

  animating_ = true;
  ++animation_generation_;
  animation_->Seed();
  ScheduleTick();
}

void DisplayPresenter::StopAnimation() {
  if (!animating_) return;

  animating_ = false;
  ++animation_generation_;
  scheduler_->Cancel(tick_timer_);
  tick_timer_ = kiosk::runtime::Scheduler::kNoTimer;

  Draw(animation_->Clear());
}

void DisplayPresenter::ScheduleTick() {
  const auto                      generation = animation_generation_;
  std::weak_ptr<DisplayPresenter> weak       = weak_from_this();
  tick_timer_ = scheduler_->ScheduleAfter(tick_interval_, [weak, generation] {
    if (auto self = weak.lock()) self->OnTick(generation);
  });
}

void DisplayPresenter::OnTick(std::uint64_t generation) {
  if (!animating_ || generation != animation_generation_) return;

  Draw(animation_->Tick());
  ScheduleTick();
}

// ------------------------------------------------------------
// Driver access (never throws)
// ------------------------------------------------------------

void DisplayPresenter::Present(const DisplayPhase& phase) {
  try {
    driver_->Present(phase, layout_.Compose(phase));
  } catch (const std::exception& e) {
    KIOSK_LOG_WARN("Display unavailable", {StringField("phase", kiosk::model::PhaseName(phase.kind)), StringField("error", e.what())});
  }
}

void DisplayPresenter::Draw(const std::vector<Pixel>& pixels) {
  if (pixels.empty()) return;

  try {
    driver_->DrawPixels(pixels);
  } catch (const std::exception& e) {
    KIOSK_LOG_DEBUG("Display pixel write failed", {StringField("error", e.what())});
  }
}

} // namespace kiosk::display
