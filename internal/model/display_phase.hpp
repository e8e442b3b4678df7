#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace kiosk::model {

enum class PhaseKind : std::uint8_t {
  kIdle         = 0,
  kBusy         = 1,
  kLimitReached = 2,
  kCountdown    = 3,
  kProcessing   = 4,
  kResult       = 5,
};

/*
  What the display shows. Exactly one phase is active at any time and
  only the orchestrator moves between them.

  countdown is meaningful for kCountdown, ok/message for kResult and
  shots_remaining for kIdle.
*/
struct DisplayPhase {
  PhaseKind   kind            = PhaseKind::kIdle;
  int         countdown       = 0;
  bool        ok              = false;
  std::string message;
  int         shots_remaining = 0;

  static DisplayPhase Idle(int shots_remaining) {
    DisplayPhase phase;
    phase.kind            = PhaseKind::kIdle;
    phase.shots_remaining = shots_remaining;
    return phase;
  }

  static DisplayPhase Busy() {
    DisplayPhase phase;
    phase.kind = PhaseKind::kBusy;
    return phase;
  }

  static DisplayPhase LimitReached() {
    DisplayPhase phase;
    phase.kind = PhaseKind::kLimitReached;
    return phase;
  }

  static DisplayPhase Countdown(int n) {
    DisplayPhase phase;
    phase.kind      = PhaseKind::kCountdown;
    phase.countdown = n;
    return phase;
  }

  static DisplayPhase Processing() {
    DisplayPhase phase;
    phase.kind = PhaseKind::kProcessing;
    return phase;
  }

  static DisplayPhase Result(bool ok, std::string message = {}) {
    DisplayPhase phase;
    phase.kind    = PhaseKind::kResult;
    phase.ok      = ok;
    phase.message = std::move(message);
    return phase;
  }
};

constexpr std::string_view PhaseName(PhaseKind kind) {
  switch (kind) {
    case PhaseKind::kIdle:
      return "idle";
    case PhaseKind::kBusy:
      return "busy";
    case PhaseKind::kLimitReached:
      return "limit_reached";
    case PhaseKind::kCountdown:
      return "countdown";
    case PhaseKind::kProcessing:
      return "processing";
    case PhaseKind::kResult:
      return "result";
  }
  return "unknown";
}

// Main sequence: Idle → Countdown → Processing → Result → Idle. Busy and
// LimitReached are side exits that only ever return to Idle. Result →
// Countdown only happens when busy is released before the settle delay.
constexpr bool CanTransition(PhaseKind from, PhaseKind to) {
  switch (to) {
    case PhaseKind::kIdle:
      return true;
    case PhaseKind::kBusy:
    case PhaseKind::kLimitReached:
      return from == PhaseKind::kIdle || from == PhaseKind::kLimitReached || from == PhaseKind::kBusy;
    case PhaseKind::kCountdown:
      return from == PhaseKind::kIdle || from == PhaseKind::kLimitReached || from == PhaseKind::kBusy || from == PhaseKind::kCountdown ||
             from == PhaseKind::kResult;
    case PhaseKind::kProcessing:
      return from == PhaseKind::kCountdown;
    case PhaseKind::kResult:
      return from == PhaseKind::kProcessing;
  }
  return false;
}

} // namespace kiosk::model
