#pragma once

#include <functional>
#include <memory>

#include "internal/model/capture.hpp"

namespace kiosk::capture {

using CaptureCallback = std::function<void(kiosk::model::CaptureOutcome)>;

/*
  External image acquisition.

  Capture() returns immediately; on_settled is invoked exactly once, from
  any thread, when the capture succeeds or fails. Latency is opaque to the
  caller. An implementation that cannot even start a capture may throw
  kiosk::util::CaptureFailure instead; on_settled is then never called.
*/
class Capturer {
 public:
  virtual ~Capturer() = default;

  virtual void Capture(CaptureCallback on_settled) = 0;
};

using CapturerPtr = std::shared_ptr<Capturer>;

} // namespace kiosk::capture
