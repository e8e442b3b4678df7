#include "layout.hpp"

#include <algorithm>
#include <string>

namespace kiosk::display {

using kiosk::model::DisplayPhase;
using kiosk::model::PhaseKind;

namespace {

constexpr const char* kIdleHeader = "Shots left";

int Advance(int size) {
  return Layout::kGlyphWidth * size + 1;
}

} // namespace

Layout::Layout(int width, int height) : width_(width), height_(height) {
}

std::vector<TextElement> Layout::Compose(const DisplayPhase& phase) const {
  switch (phase.kind) {
    case PhaseKind::kIdle:
      return {Header(kIdleHeader), BigNumber(phase.shots_remaining)};
    case PhaseKind::kBusy:
      return {Header("Busy...")};
    case PhaseKind::kLimitReached:
      return {Header("Limit reached")};
    case PhaseKind::kCountdown:
      return {Header("Hold steady..."), BigNumber(phase.countdown)};
    case PhaseKind::kProcessing:
      return {Header("Processing...")};
    case PhaseKind::kResult: {
      if (phase.ok) return {Header("Saved")};

      std::vector<TextElement> text{Header("Error")};
      if (!phase.message.empty()) {
        text.push_back(TextElement{0, kMessageRow, 1, phase.message.substr(0, kMessageMaxLen)});
      }
      return text;
    }
  }
  return {};
}

std::vector<Rect> Layout::IdleReservedRegions(uint32_t daily_limit) const {
  return {Bounds(Header(kIdleHeader)), Bounds(BigNumber(static_cast<int>(daily_limit)))};
}

Rect Layout::Bounds(const TextElement& text) {
  const int len = static_cast<int>(text.text.size());
  return Rect{text.x, text.y, text.x + std::max(1, len * Advance(text.size)) - 1, text.y + kGlyphHeight * text.size - 1};
}

TextElement Layout::Header(std::string text) const {
  return TextElement{0, 0, 1, std::move(text)};
}

TextElement Layout::BigNumber(int value) const {
  auto      digits = std::to_string(value);
  const int total  = Advance(kBigSize) * static_cast<int>(digits.size());
  const int x      = std::max(0, (width_ - total) / 2);
  const int y      = std::max(0, (height_ - kGlyphHeight * kBigSize) / 2);
  return TextElement{x, y, kBigSize, std::move(digits)};
}

} // namespace kiosk::display
