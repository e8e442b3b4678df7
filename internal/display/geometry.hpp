#pragma once

#include <string>

namespace kiosk::display {

struct Point {
  int x = 0;
  int y = 0;

  bool operator==(const Point&) const = default;
};

struct Pixel {
  int  x  = 0;
  int  y  = 0;
  bool on = false;
};

// Inclusive bounds.
struct Rect {
  int x0 = 0;
  int y0 = 0;
  int x1 = 0;
  int y1 = 0;

  constexpr bool Contains(Point p) const {
    return p.x >= x0 && p.x <= x1 && p.y >= y0 && p.y <= y1;
  }

  constexpr bool Intersects(const Rect& other) const {
    return x0 <= other.x1 && other.x0 <= x1 && y0 <= other.y1 && other.y0 <= y1;
  }
};

struct TextElement {
  int         x    = 0;
  int         y    = 0;
  int         size = 1;
  std::string text;
};

} // namespace kiosk::display
