#include "idle_animation.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace kiosk::display {

namespace {

std::mt19937 MakeEngine(std::uint64_t seed) {
  if (seed == 0) {
    return std::mt19937{std::random_device{}()};
  }
  return std::mt19937{static_cast<std::mt19937::result_type>(seed)};
}

void CheckPlacement(const Rect& area, int width, int height, const std::vector<Rect>& reserved, const std::string& what) {
  if (area.x0 < 0 || area.y0 < 0 || area.x1 >= width || area.y1 >= height) {
    throw std::invalid_argument(what + " lies outside the display");
  }
  for (const auto& region : reserved) {
    if (area.Intersects(region)) {
      throw std::invalid_argument(what + " overlaps a status text region");
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Flicker
// ------------------------------------------------------------

FlickerAnimation::FlickerAnimation(FlickerOptions options, std::uint64_t seed) : options_(std::move(options)), rng_(MakeEngine(seed)) {
  if (options_.safe_regions.empty()) {
    throw std::invalid_argument("flicker animation needs at least one safe region");
  }
}

void FlickerAnimation::Seed() {
  std::bernoulli_distribution coin(0.5);

  stars_.clear();
  stars_.reserve(options_.point_count);
  for (std::size_t i = 0; i < options_.point_count; ++i) {
    const auto& region = options_.safe_regions[i % options_.safe_regions.size()];
    stars_.push_back(Star{RandomPointIn(region), coin(rng_)});
  }
  ticks_since_move_ = 0;
}

std::vector<Pixel> FlickerAnimation::Tick() {
  std::vector<Pixel> writes;
  writes.reserve(stars_.size() * 2);

  // erase whatever the previous tick drew
  for (const auto& star : stars_) {
    if (star.lit) writes.push_back(Pixel{star.point.x, star.point.y, false});
  }

  std::bernoulli_distribution toggle(options_.toggle_probability);
  for (auto& star : stars_) {
    if (toggle(rng_)) star.lit = !star.lit;
  }

  if (++ticks_since_move_ >= options_.relocate_every_ticks && !stars_.empty()) {
    ticks_since_move_ = 0;

    const auto moves = std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(stars_.size() * options_.relocate_fraction)));
    std::uniform_int_distribution<std::size_t> pick(0, stars_.size() - 1);
    for (std::size_t i = 0; i < moves; ++i) {
      const auto idx    = pick(rng_);
      const auto& region = options_.safe_regions[idx % options_.safe_regions.size()];
      stars_[idx].point  = RandomPointIn(region);
      stars_[idx].lit    = true;
    }
  }

  for (const auto& star : stars_) {
    if (star.lit) writes.push_back(Pixel{star.point.x, star.point.y, true});
  }
  return writes;
}

std::vector<Pixel> FlickerAnimation::Clear() {
  std::vector<Pixel> writes;
  for (auto& star : stars_) {
    if (star.lit) writes.push_back(Pixel{star.point.x, star.point.y, false});
    star.lit = false;
  }
  return writes;
}

std::vector<Point> FlickerAnimation::LitPoints() const {
  std::vector<Point> points;
  for (const auto& star : stars_) {
    if (star.lit) points.push_back(star.point);
  }
  return points;
}

Point FlickerAnimation::RandomPointIn(const Rect& region) {
  std::uniform_int_distribution<int> x(region.x0, region.x1);
  std::uniform_int_distribution<int> y(region.y0, region.y1);
  return Point{x(rng_), y(rng_)};
}

// ------------------------------------------------------------
// Orbit
// ------------------------------------------------------------

OrbitAnimation::OrbitAnimation(Point center, int radius, int steps, std::uint64_t seed) : rng_(MakeEngine(seed)) {
  if (radius <= 0 || steps <= 0) {
    throw std::invalid_argument("orbit animation needs a positive radius and step count");
  }

  path_.reserve(static_cast<std::size_t>(steps));
  for (int i = 0; i < steps; ++i) {
    const double angle = 2.0 * std::numbers::pi * i / steps;
    path_.push_back(Point{center.x + static_cast<int>(std::lround(radius * std::cos(angle))),
                          center.y + static_cast<int>(std::lround(radius * std::sin(angle)))});
  }
}

void OrbitAnimation::Seed() {
  std::uniform_int_distribution<std::size_t> start(0, path_.size() - 1);
  index_ = start(rng_);
  lit_   = false;
}

std::vector<Pixel> OrbitAnimation::Tick() {
  std::vector<Pixel> writes;
  if (lit_) {
    writes.push_back(Pixel{path_[index_].x, path_[index_].y, false});
    index_ = (index_ + 1) % path_.size();
  }
  lit_ = true;
  writes.push_back(Pixel{path_[index_].x, path_[index_].y, true});
  return writes;
}

std::vector<Pixel> OrbitAnimation::Clear() {
  if (!lit_) return {};
  lit_ = false;
  return {Pixel{path_[index_].x, path_[index_].y, false}};
}

std::vector<Point> OrbitAnimation::LitPoints() const {
  if (!lit_) return {};
  return {path_[index_]};
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

std::unique_ptr<IdleAnimation> MakeIdleAnimation(const kiosk::runtime::config::AnimationConfig& config, int width, int height,
                                                 const std::vector<Rect>& reserved) {
  if (config.variant() == "orbit") {
    const Point center{width / 2, height / 2};
    auto        orbit = std::make_unique<OrbitAnimation>(center, static_cast<int>(config.orbit_radius()), static_cast<int>(config.orbit_steps()),
                                                  config.seed());
    for (const auto& point : orbit->Path()) {
      CheckPlacement(Rect{point.x, point.y, point.x, point.y}, width, height, reserved, "orbit path");
    }
    return orbit;
  }

  FlickerOptions options;
  for (const auto& region : config.safe_regions()) {
    Rect rect{static_cast<int>(region.x0()), static_cast<int>(region.y0()), static_cast<int>(region.x1()), static_cast<int>(region.y1())};
    CheckPlacement(rect, width, height, reserved, "animation safe region");
    options.safe_regions.push_back(rect);
  }
  options.point_count          = config.point_count();
  options.toggle_probability   = config.toggle_probability();
  options.relocate_every_ticks = std::max<std::uint32_t>(1, config.relocate_every_ms() * config.fps() / 1000);
  options.relocate_fraction    = config.relocate_fraction();

  return std::make_unique<FlickerAnimation>(std::move(options), config.seed());
}

} // namespace kiosk::display
