#pragma once

#include <cstdint>
#include <vector>

#include "geometry.hpp"
#include "internal/model/display_phase.hpp"

namespace kiosk::display {

/*
  Places the text of each phase on the panel using 5x7 glyph metrics:
  a header row at the top left and, where the phase has one, a centered
  number at triple size.
*/
class Layout {
 public:
  static constexpr int kGlyphWidth    = 5;
  static constexpr int kGlyphHeight   = 7;
  static constexpr int kBigSize       = 3;
  static constexpr int kMessageRow    = 16;
  static constexpr int kMessageMaxLen = 21;

  Layout(int width, int height);

  std::vector<TextElement> Compose(const kiosk::model::DisplayPhase& phase) const;

  // Areas the idle screen may draw text into for any count up to daily_limit.
  std::vector<Rect> IdleReservedRegions(uint32_t daily_limit) const;

  static Rect Bounds(const TextElement& text);

  int Width() const {
    return width_;
  }
  int Height() const {
    return height_;
  }

 private:
  TextElement Header(std::string text) const;
  TextElement BigNumber(int value) const;

  int width_;
  int height_;
};

} // namespace kiosk::display
