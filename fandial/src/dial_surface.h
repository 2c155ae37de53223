#pragma once

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "mbase/access.h"

namespace fandial {

enum class FontWeight {
  kRegular,
  kBold,
};

/// Drawing target handed to `DialView::Render()`. Coordinates are local to the widget,
/// with (0, 0) at its top-left corner.
class ISurface {
public:
  virtual ~ISurface() = default;
  MBASE_DEFAULT_COPY_DISALLOW_MOVE(ISurface);

  /// Size of the drawable area in pixels.
  virtual raylib::Vector2 GetSize() const = 0;

  virtual void DrawFilledCircle(raylib::Vector2 const& center, float radius, Color color) = 0;

  /// Draw `text` so that its bounding box is centered on `position`.
  virtual void DrawCenteredText(
    char const* text,
    raylib::Vector2 const& position,
    Color color,
    float font_size,
    FontWeight weight
  ) = 0;

protected:
  ISurface() = default;
};

} // namespace fandial
