#include "log_display_driver.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace kiosk::display {

using kiosk::observability::StringField;

void LogDisplayDriver::Present(const kiosk::model::DisplayPhase& phase, const std::vector<TextElement>& text) {
  std::string content;
  for (const auto& element : text) {
    if (!content.empty()) content += " | ";
    content += element.text;
  }
  KIOSK_LOG_INFO("Display", {StringField("phase", kiosk::model::PhaseName(phase.kind)), StringField("text", content)});
}

void LogDisplayDriver::DrawPixels(const std::vector<Pixel>&) {
}

} // namespace kiosk::display
