// TU header --------------------------------------------
#include "raylib_surface.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>

namespace fandial {

namespace {

// raylib's default font is tiny; spacing scales with size like `DrawText()` does.
constexpr float kDefaultFontSize = 10.0f;

float ComputeSpacing(float font_size) {
  return std::max(1.0f, font_size / kDefaultFontSize);
}

} // namespace

RaylibSurface::RaylibSurface(Rectangle const& bounds, Font font)
  : bounds_(bounds)
  , font_(font)
{
}

raylib::Vector2 RaylibSurface::GetSize() const {
  return raylib::Vector2 { bounds_.width, bounds_.height };
}

void RaylibSurface::DrawFilledCircle(raylib::Vector2 const& center, float radius, Color color) {
  if (radius <= 0.0f) return;
  ::DrawCircleV(ToScreen(center), radius, color);
}

void RaylibSurface::DrawCenteredText(
  char const* text,
  raylib::Vector2 const& position,
  Color color,
  float font_size,
  FontWeight weight
) {
  if (text == nullptr || text[0] == '\0') return;

  float const spacing = ComputeSpacing(font_size);
  raylib::Vector2 const text_size = ::MeasureTextEx(font_, text, font_size, spacing);
  raylib::Vector2 origin = ToScreen(position) - text_size * 0.5f;
  // Whole pixels keep the glyphs crisp.
  origin.x = std::floor(origin.x);
  origin.y = std::floor(origin.y);

  ::DrawTextEx(font_, text, origin, font_size, spacing, color);

  // No bold face in the default font; overstrike one pixel to the right instead.
  if (weight == FontWeight::kBold) {
    ::DrawTextEx(font_, text, origin + raylib::Vector2(1.0f, 0.0f), font_size, spacing, color);
  }
}

raylib::Vector2 RaylibSurface::ToScreen(raylib::Vector2 const& local) const {
  return raylib::Vector2 { bounds_.x + local.x, bounds_.y + local.y };
}

} // namespace fandial
