#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "geometry.hpp"

namespace kiosk::runtime::config {
class AnimationConfig;
}

namespace kiosk::display {

/*
  Decorative idle motion as a tick-driven state machine.

  The presenter owns the timer; an animation only turns ticks into pixel
  writes. Every write list erases before it draws, and Clear() returns
  the writes that leave nothing lit.
*/
class IdleAnimation {
 public:
  virtual ~IdleAnimation() = default;

  // Fresh point set, nothing lit yet.
  virtual void Seed() = 0;

  virtual std::vector<Pixel> Tick() = 0;

  virtual std::vector<Pixel> Clear() = 0;

  virtual std::vector<Point> LitPoints() const = 0;
};

struct FlickerOptions {
  std::vector<Rect> safe_regions;
  std::size_t       point_count        = 10;
  double            toggle_probability = 0.5;
  // Relocation period expressed in ticks.
  std::uint32_t relocate_every_ticks = 15;
  double        relocate_fraction    = 0.2;
};

/*
  A fixed number of points inside the safe regions, each flipping on or
  off at random every tick. Every relocate_every_ticks a fraction of them
  jumps to a new random spot and lights up.
*/
class FlickerAnimation : public IdleAnimation {
 public:
  FlickerAnimation(FlickerOptions options, std::uint64_t seed);

  void               Seed() override;
  std::vector<Pixel> Tick() override;
  std::vector<Pixel> Clear() override;
  std::vector<Point> LitPoints() const override;

 private:
  struct Star {
    Point point;
    bool  lit = false;
  };

  Point RandomPointIn(const Rect& region);

  FlickerOptions    options_;
  std::mt19937      rng_;
  std::vector<Star> stars_;
  std::uint32_t     ticks_since_move_ = 0;
};

/*
  One point travelling a precomputed circle, one step per tick.
*/
class OrbitAnimation : public IdleAnimation {
 public:
  OrbitAnimation(Point center, int radius, int steps, std::uint64_t seed);

  void               Seed() override;
  std::vector<Pixel> Tick() override;
  std::vector<Pixel> Clear() override;
  std::vector<Point> LitPoints() const override;

  const std::vector<Point>& Path() const {
    return path_;
  }

 private:
  std::vector<Point> path_;
  std::mt19937       rng_;
  std::size_t        index_ = 0;
  bool               lit_   = false;
};

/*
  Builds the configured variant and checks it never draws off-panel or
  into a reserved region. Throws std::invalid_argument otherwise.
*/
std::unique_ptr<IdleAnimation> MakeIdleAnimation(const kiosk::runtime::config::AnimationConfig& config, int width, int height,
                                                 const std::vector<Rect>& reserved);

} // namespace kiosk::display
