#include "internal/input/debouncer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/input/sysfs_button_input.hpp"
#include "unit/test_fakes.hpp"

using kiosk::input::Debouncer;
using namespace std::chrono_literals;

namespace {

const Debouncer::TimePoint kStart{};

void TestStablePressFiresOnce() {
  Debouncer debouncer(10ms);

  assert(!debouncer.Update(true, kStart));
  assert(!debouncer.Update(true, kStart + 5ms));
  assert(debouncer.Update(true, kStart + 10ms));
  assert(debouncer.Pressed());

  // holding the button produces no further edges
  assert(!debouncer.Update(true, kStart + 50ms));
  assert(!debouncer.Update(true, kStart + 500ms));
}

void TestGlitchIsIgnored() {
  Debouncer debouncer(10ms);

  assert(!debouncer.Update(true, kStart));
  assert(!debouncer.Update(true, kStart + 4ms));
  assert(!debouncer.Update(false, kStart + 6ms));
  assert(!debouncer.Update(false, kStart + 30ms));
  assert(!debouncer.Pressed());

  // the filter window restarts after a glitch
  assert(!debouncer.Update(true, kStart + 40ms));
  assert(!debouncer.Update(true, kStart + 49ms));
  assert(debouncer.Update(true, kStart + 50ms));
}

void TestReleaseIsNotAnEdge() {
  Debouncer debouncer(10ms);

  debouncer.Update(true, kStart);
  assert(debouncer.Update(true, kStart + 10ms));

  assert(!debouncer.Update(false, kStart + 100ms));
  assert(!debouncer.Update(false, kStart + 110ms));
  assert(!debouncer.Pressed());

  // second press
  assert(!debouncer.Update(true, kStart + 200ms));
  assert(debouncer.Update(true, kStart + 215ms));
}

void TestZeroWindowPassesThrough() {
  Debouncer debouncer(0ms);
  assert(debouncer.Update(true, kStart));
  assert(!debouncer.Update(false, kStart + 1ms));
  assert(debouncer.Update(true, kStart + 2ms));
}

void SetLevel(const std::filesystem::path& value_path, char level) {
  std::ofstream out(value_path, std::ios::trunc);
  out << level << '\n';
}

template <typename Predicate> bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return predicate();
}

kiosk::runtime::config::ButtonConfig ButtonConfigFor(const std::filesystem::path& root) {
  kiosk::runtime::config::ButtonConfig config;
  config.set_enabled(true);
  config.set_gpio(17);
  config.set_sysfs_root(root.string());
  config.set_debounce_ms(10);
  config.set_poll_interval_ms(1);
  return config;
}

void TestSysfsButtonReportsPresses() {
  const auto root = kiosk::testing::FreshDirectory("button_sysfs");
  const auto line = root / "gpio17";
  std::filesystem::create_directories(line);
  SetLevel(line / "value", '1');

  kiosk::input::SysfsButtonInput button(ButtonConfigFor(root));
  std::atomic<int>               presses{0};
  button.OnEdge([&] { ++presses; });
  assert(button.Start());

  // active low: pulling the line to 0 is a press
  SetLevel(line / "value", '0');
  assert(WaitFor([&] { return presses.load() == 1; }, 2000ms));

  SetLevel(line / "value", '1');
  std::this_thread::sleep_for(50ms);
  assert(presses.load() == 1);

  SetLevel(line / "value", '0');
  assert(WaitFor([&] { return presses.load() == 2; }, 2000ms));

  button.Stop();

  std::ifstream direction(line / "direction");
  std::string   value;
  direction >> value;
  assert(value == "in");
}

void TestMissingGpioIsReportedNotFatal() {
  const auto root = kiosk::testing::FreshDirectory("button_missing") / "absent";

  kiosk::input::SysfsButtonInput button(ButtonConfigFor(root));
  button.OnEdge([] {});
  assert(!button.Start());
  button.Stop();
}

} // namespace

int main() {
  TestStablePressFiresOnce();
  TestGlitchIsIgnored();
  TestReleaseIsNotAnEdge();
  TestZeroWindowPassesThrough();
  TestSysfsButtonReportsPresses();
  TestMissingGpioIsReportedNotFatal();

  std::cout << "shot_kiosk_unit_button_input: pass\n";
  return 0;
}
