// TU header --------------------------------------------
#include "dial_geometry.h"

// c++ headers ------------------------------------------
#include <cassert>

#include <algorithm>

// project headers --------------------------------------
#include "angle.h"

namespace fandial {

namespace {

Angle const kStartAngle = Angle::Pi() * (9.0f / 8.0f);
Angle const kSlotStep = Angle::Pi() / 4.0f;

} // namespace

float ComputeRadius(float width, float height) {
  return std::min(width, height) / 2.0f * 0.8f;
}

raylib::Vector2 PositionForIndex(
  uint32_t ordinal,
  float ring_radius,
  float center_x,
  float center_y
) {
  assert(ordinal < kFanSpeedCount && "Dial slot out of range");

  Angle const angle = kStartAngle + kSlotStep * static_cast<float>(ordinal);
  return raylib::Vector2 {
    center_x + ring_radius * angle.Cos(),
    center_y + ring_radius * angle.Sin()
  };
}

raylib::Vector2 PositionForSpeed(
  FanSpeed speed,
  float ring_radius,
  raylib::Vector2 const& center
) {
  return PositionForIndex(GetOrdinal(speed), ring_radius, center.x, center.y);
}

} // namespace fandial
