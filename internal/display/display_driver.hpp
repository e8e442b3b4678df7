#pragma once

#include <memory>
#include <vector>

#include "geometry.hpp"
#include "internal/model/display_phase.hpp"

namespace kiosk::display {

/*
  Low-level panel access.

  Calls are best effort and bounded in time. Implementations throw
  util::DisplayUnavailable when the panel cannot be reached; the presenter
  logs that and carries on.
*/
class DisplayDriver {
 public:
  virtual ~DisplayDriver() = default;

  // Clears the panel and draws the laid-out text for the phase.
  virtual void Present(const kiosk::model::DisplayPhase& phase, const std::vector<TextElement>& text) = 0;

  virtual void DrawPixels(const std::vector<Pixel>& pixels) = 0;
};

using DisplayDriverPtr = std::shared_ptr<DisplayDriver>;

} // namespace kiosk::display
