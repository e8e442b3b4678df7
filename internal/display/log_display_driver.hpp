#pragma once

#include "display_driver.hpp"

namespace kiosk::display {

/*
  Headless driver: phases are logged, pixel traffic is not.
*/
class LogDisplayDriver : public DisplayDriver {
 public:
  void Present(const kiosk::model::DisplayPhase& phase, const std::vector<TextElement>& text) override;
  void DrawPixels(const std::vector<Pixel>& pixels) override;
};

} // namespace kiosk::display
