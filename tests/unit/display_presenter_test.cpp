#include "internal/display/display_presenter.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "unit/test_fakes.hpp"

using kiosk::display::DisplayPresenter;
using kiosk::display::FlickerAnimation;
using kiosk::display::FlickerOptions;
using kiosk::display::Layout;
using kiosk::display::Rect;
using kiosk::model::DisplayPhase;
using kiosk::model::PhaseKind;
using kiosk::runtime::ManualScheduler;
using kiosk::testing::RecordingDisplayDriver;
using namespace std::chrono_literals;

namespace {

struct Fixture {
  Fixture() {
    scheduler = std::make_shared<ManualScheduler>();
    driver    = std::make_shared<RecordingDisplayDriver>();

    // every point flips each tick, so no tick is empty
    FlickerOptions options;
    options.safe_regions       = {Rect{104, 0, 127, 15}, Rect{0, 48, 27, 63}};
    options.toggle_probability = 1.0;
    presenter = std::make_shared<DisplayPresenter>(driver, scheduler, Layout(128, 64), std::make_unique<FlickerAnimation>(options, 21), 200ms);
  }

  std::shared_ptr<ManualScheduler>        scheduler;
  std::shared_ptr<RecordingDisplayDriver> driver;
  std::shared_ptr<DisplayPresenter>       presenter;
};

std::size_t PixelCalls(const std::vector<RecordingDisplayDriver::Call>& calls, std::size_t from = 0) {
  std::size_t count = 0;
  for (std::size_t i = from; i < calls.size(); ++i) {
    if (!calls[i].present) ++count;
  }
  return count;
}

void TestIdleRunsAnimation() {
  Fixture f;
  f.presenter->Show(DisplayPhase::Idle(10));
  assert(f.presenter->AnimationRunning());

  f.scheduler->AdvanceBy(2000ms);
  assert(PixelCalls(f.driver->Calls()) == 10);

  const auto presented = f.driver->Presented();
  assert(presented.size() == 1);
  assert(presented[0].kind == PhaseKind::kIdle);
  assert(presented[0].shots_remaining == 10);
}

void TestLeavingIdleClearsAnimationFirst() {
  Fixture f;
  f.presenter->Show(DisplayPhase::Idle(7));
  f.scheduler->AdvanceBy(1000ms);

  const auto lit   = f.presenter->Animation()->LitPoints();
  const auto start = f.driver->Calls().size();

  f.presenter->Show(DisplayPhase::Countdown(3));
  assert(!f.presenter->AnimationRunning());
  assert(f.presenter->Animation()->LitPoints().empty());

  auto calls = f.driver->Calls();
  std::size_t next = start;
  if (!lit.empty()) {
    assert(!calls[next].present);
    assert(calls[next].pixels.size() == lit.size());
    for (const auto& pixel : calls[next].pixels) assert(!pixel.on);
    ++next;
  }
  assert(calls[next].present);
  assert(calls[next].phase.kind == PhaseKind::kCountdown);

  // nothing decorative is drawn while not idle
  f.scheduler->AdvanceBy(3000ms);
  f.presenter->Show(DisplayPhase::Processing());
  f.scheduler->AdvanceBy(3000ms);
  assert(PixelCalls(f.driver->Calls(), next) == 0);
}

void TestReturningToIdleResumesAnimation() {
  Fixture f;
  f.presenter->Show(DisplayPhase::Idle(3));
  f.presenter->Show(DisplayPhase::Countdown(1));
  f.scheduler->AdvanceBy(1000ms);
  f.presenter->Show(DisplayPhase::Processing());
  f.presenter->Show(DisplayPhase::Result(true));

  const auto before = f.driver->Calls().size();
  f.presenter->Show(DisplayPhase::Idle(2));
  assert(f.presenter->AnimationRunning());

  f.scheduler->AdvanceBy(600ms);
  assert(PixelCalls(f.driver->Calls(), before) == 3);
}

void TestDriverFailuresAreContained() {
  Fixture f;
  f.driver->fail_present = true;
  f.driver->fail_pixels  = true;

  f.presenter->Show(DisplayPhase::Idle(10));
  f.scheduler->AdvanceBy(1000ms);
  f.presenter->Show(DisplayPhase::Result(false, "Check camera"));

  assert(f.presenter->Current().kind == PhaseKind::kResult);
  assert(!f.presenter->AnimationRunning());
}

void TestWithoutAnimation() {
  auto scheduler = std::make_shared<ManualScheduler>();
  auto driver    = std::make_shared<RecordingDisplayDriver>();
  auto presenter = std::make_shared<DisplayPresenter>(driver, scheduler, Layout(128, 64), nullptr, 200ms);

  presenter->Show(DisplayPhase::Idle(5));
  assert(!presenter->AnimationRunning());
  assert(scheduler->PendingTimers() == 0);
  assert(driver->Presented().size() == 1);
}

void TestDestroyedPresenterLeavesInertTimers() {
  Fixture f;
  f.presenter->Show(DisplayPhase::Idle(5));
  assert(f.scheduler->PendingTimers() == 1);

  const auto calls = f.driver->Calls().size();
  f.presenter.reset();

  // the tick outlives the presenter on the shared scheduler
  f.scheduler->AdvanceBy(1000ms);
  assert(f.driver->Calls().size() == calls);
  assert(f.scheduler->PendingTimers() == 0);
}

void TestLayoutPlacesPhaseText() {
  Layout layout(128, 64);

  const auto idle = layout.Compose(DisplayPhase::Idle(10));
  assert(idle.size() == 2);
  assert(idle[0].text == "Shots left" && idle[0].x == 0 && idle[0].y == 0 && idle[0].size == 1);
  assert(idle[1].text == "10" && idle[1].size == 3);
  assert(idle[1].x == 48 && idle[1].y == 21);

  const auto countdown = layout.Compose(DisplayPhase::Countdown(2));
  assert(countdown[0].text == "Hold steady...");
  assert(countdown[1].text == "2");

  assert(layout.Compose(DisplayPhase::Processing())[0].text == "Processing...");
  assert(layout.Compose(DisplayPhase::Result(true))[0].text == "Saved");
  assert(layout.Compose(DisplayPhase::LimitReached())[0].text == "Limit reached");
  assert(layout.Compose(DisplayPhase::Busy())[0].text == "Busy...");

  const auto error = layout.Compose(DisplayPhase::Result(false, "a message that is far too long for the panel"));
  assert(error.size() == 2);
  assert(error[0].text == "Error");
  assert(error[1].y == Layout::kMessageRow);
  assert(error[1].text.size() == static_cast<std::size_t>(Layout::kMessageMaxLen));

  const auto reserved = layout.IdleReservedRegions(10);
  assert(reserved.size() == 2);
  assert(reserved[0].x1 == 59 && reserved[0].y1 == 6);
  assert(reserved[1].x0 == 48 && reserved[1].x1 == 79);
}

} // namespace

int main() {
  TestIdleRunsAnimation();
  TestLeavingIdleClearsAnimationFirst();
  TestReturningToIdleResumesAnimation();
  TestDriverFailuresAreContained();
  TestWithoutAnimation();
  TestDestroyedPresenterLeavesInertTimers();
  TestLayoutPlacesPhaseText();

  std::cout << "shot_kiosk_unit_display_presenter: pass\n";
  return 0;
}
