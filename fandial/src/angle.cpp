// TU header --------------------------------------------
#include "angle.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <numbers>

// external headers -------------------------------------
#include "raylib.h"

Angle Angle::FromDeg(float deg) {
  return Angle(deg * DEG2RAD);
}
Angle Angle::Pi() {
  return Angle(std::numbers::pi_v<float>);
}

Angle Angle::WrapAround() const {
  constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
  float r = std::fmod(rad_, kTwoPi);
  if (r < 0.0f) r += kTwoPi;
  return Angle(r);
}

float Angle::ToDeg() const {
  return rad_ * RAD2DEG;
}

float Angle::Sin() const { return std::sin(rad_); }
float Angle::Cos() const { return std::cos(rad_); }
