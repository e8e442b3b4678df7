#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace kiosk::model {

enum class TriggerSource : std::uint8_t {
  kButton = 0,
  kHttp   = 1,
};

constexpr std::string_view SourceName(TriggerSource source) {
  return source == TriggerSource::kButton ? "button" : "http";
}

/*
  An accepted trigger. Consumed exactly once by the orchestrator; never
  queued.
*/
struct CaptureRequest {
  TriggerSource       source = TriggerSource::kButton;
  kiosk::util::TimePoint accepted_at;
};

/*
  What the external capturer reports, once per capture.
*/
struct CaptureOutcome {
  bool                       success = false;
  std::optional<std::string> filename;
  std::optional<std::string> error;

  static CaptureOutcome Succeeded(std::string filename) {
    return {true, std::move(filename), std::nullopt};
  }

  static CaptureOutcome Failed(std::string error) {
    return {false, std::nullopt, std::move(error)};
  }
};

enum class CaptureStatus : std::uint8_t {
  kCaptured     = 0,
  kBusy         = 1,
  kLimitReached = 2,
  kFailed       = 3,
};

/*
  Terminal answer for whoever triggered the capture.
*/
struct CaptureResult {
  CaptureStatus status = CaptureStatus::kFailed;
  std::string   filename;
  std::string   error;
};

constexpr std::string_view StatusName(CaptureStatus status) {
  switch (status) {
    case CaptureStatus::kCaptured:
      return "captured";
    case CaptureStatus::kBusy:
      return "busy";
    case CaptureStatus::kLimitReached:
      return "limit_reached";
    case CaptureStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace kiosk::model
