#pragma once

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "dial_surface.h"

namespace fandial {

/// `ISurface` over raylib's immediate-mode drawing, translated to `bounds`.
///
/// Must be used between `BeginDrawing()`/`EndDrawing()` or `BeginTextureMode()`/`EndTextureMode()`.
class RaylibSurface final : public ISurface {
public:
  explicit RaylibSurface(Rectangle const& bounds, Font font = GetFontDefault());
  ~RaylibSurface() override = default;
  MBASE_DISALLOW_COPY_MOVE(RaylibSurface);

  //
  // ISurface implementation
  //

  raylib::Vector2 GetSize() const override;

  void DrawFilledCircle(raylib::Vector2 const& center, float radius, Color color) override;

  void DrawCenteredText(
    char const* text,
    raylib::Vector2 const& position,
    Color color,
    float font_size,
    FontWeight weight
  ) override;

private:
  raylib::Vector2 ToScreen(raylib::Vector2 const& local) const;

  Rectangle bounds_;
  Font font_;
};

} // namespace fandial
