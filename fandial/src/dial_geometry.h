#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "fan_speed.h"

namespace fandial {

/// Offset from the dial radius to the ring the speed labels sit on; just outside the disc.
constexpr float kRadiusOffsetLabel = 30.0f;
/// Offset from the dial radius to the ring the indicator dot sits on; inside the disc.
constexpr float kRadiusOffsetIndicator = -35.0f;

/// Radius of the dial disc for a widget of the given size: 80% of half the shorter side.
float ComputeRadius(float width, float height);

/// Point on a circle of `ring_radius` around (`center_x`, `center_y`) for slot `ordinal`.
///
/// Slots are 45° apart starting at 202.5°, so slot 0 is lower-left in screen space
/// and the slots proceed clockwise. Only slots 0..3 are used.
raylib::Vector2 PositionForIndex(
  uint32_t ordinal,
  float ring_radius,
  float center_x,
  float center_y
);

raylib::Vector2 PositionForSpeed(
  FanSpeed speed,
  float ring_radius,
  raylib::Vector2 const& center
);

} // namespace fandial
