#include "internal/display/pipe_display_driver.hpp"

#include <cassert>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "unit/test_fakes.hpp"

using kiosk::display::Pixel;
using kiosk::display::PipeDisplayDriver;
using kiosk::display::TextElement;
using kiosk::model::DisplayPhase;
using kiosk::util::DisplayUnavailable;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream            in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Runs fn and returns the DisplayUnavailable message, or "" if nothing was thrown.
template <typename Fn> std::string FailureOf(Fn fn) {
  try {
    fn();
  } catch (const DisplayUnavailable& e) {
    return e.what();
  }
  return "";
}

std::string Quoted(const std::filesystem::path& path) {
  return "'" + path.string() + "'";
}

void TestCommandsAreAcknowledged() {
  const auto dir    = kiosk::testing::FreshDirectory("pipe_driver_ack");
  const auto log    = dir / "commands.log";
  const auto starts = dir / "starts.log";

  // banner and non-status lines come before each ack
  const std::string helper = "echo start >> " + Quoted(starts) + "; printf 'kiosk display ready\\n'; " +
                             "while IFS= read -r line; do printf '%s\\n' \"$line\" >> " + Quoted(log) +
                             "; echo '{\"note\":\"drawing\"}'; echo '{\"status\":\"ok\"}'; done";
  PipeDisplayDriver driver(helper, 2000ms);

  driver.Present(DisplayPhase::Idle(4), {TextElement{10, 20, 3, "4"}, TextElement{0, 56, 1, "Press button"}});
  driver.DrawPixels({Pixel{1, 2, true}, Pixel{3, 4, false}});
  driver.DrawPixels({});

  const auto lines = ReadLines(log);
  assert(lines.size() == 2);
  assert(Contains(lines[0], "\"action\":\"frame\""));
  assert(Contains(lines[0], "\"phase\":\"idle\""));
  assert(Contains(lines[0], "\"text\":\"Press button\""));
  assert(Contains(lines[0], "\"size\":3"));
  assert(Contains(lines[1], "\"action\":\"pixels\""));
  assert(Contains(lines[1], "[1,2,1]"));
  assert(Contains(lines[1], "[3,4,0]"));

  // one helper served every command
  assert(ReadLines(starts).size() == 1);
}

void TestErrorReplyIsReported() {
  const std::string helper = "while IFS= read -r line; do echo '{\"status\":\"error\",\"message\":\"spi busy\"}'; done";
  PipeDisplayDriver driver(helper, 2000ms);

  const auto failure = FailureOf([&] { driver.Present(DisplayPhase::Busy(), {}); });
  assert(Contains(failure, "display helper error: spi busy"));
}

void TestSilentHelperTimesOutAndRestarts() {
  const auto dir    = kiosk::testing::FreshDirectory("pipe_driver_timeout");
  const auto starts = dir / "starts.log";

  const std::string helper = "echo start >> " + Quoted(starts) + "; while IFS= read -r line; do sleep 5; done";
  PipeDisplayDriver driver(helper, 100ms);

  const auto started = std::chrono::steady_clock::now();
  assert(Contains(FailureOf([&] { driver.Present(DisplayPhase::Busy(), {}); }), "timed out"));
  assert(std::chrono::steady_clock::now() - started < 2s);

  // the hung helper was killed; the next command starts a fresh one
  assert(Contains(FailureOf([&] { driver.DrawPixels({Pixel{0, 0, true}}); }), "timed out"));
  assert(ReadLines(starts).size() == 2);
}

void TestExitedHelperIsReported() {
  PipeDisplayDriver driver("read -r line; exit 0", 2000ms);
  assert(Contains(FailureOf([&] { driver.Present(DisplayPhase::LimitReached(), {}); }), "display helper exited"));
}

void TestMissingHelperIsReported() {
  PipeDisplayDriver driver("exec /nonexistent/kiosk_display_helper", 2000ms);
  assert(!FailureOf([&] { driver.Present(DisplayPhase::Busy(), {}); }).empty());
}

} // namespace

int main() {
  // a helper that already exited must surface as an error, not kill the test
  std::signal(SIGPIPE, SIG_IGN);

  TestCommandsAreAcknowledged();
  TestErrorReplyIsReported();
  TestSilentHelperTimesOutAndRestarts();
  TestExitedHelperIsReported();
  TestMissingHelperIsReported();

  std::cout << "shot_kiosk_unit_pipe_display_driver: pass\n";
}
