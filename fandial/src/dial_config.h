#pragma once

// c++ headers ------------------------------------------
#include <optional>
#include <string_view>

// external headers -------------------------------------
#include "raylib.h"

class IAssetManager;

namespace fandial {

/// Colors of the dial disc per speed. OFF is always drawn gray and is not configurable.
/// Anything left unset stays fully transparent.
struct DialConfig final {
  Color color_low    = Color { 0, 0, 0, 0 };
  Color color_medium = Color { 0, 0, 0, 0 };
  Color color_high   = Color { 0, 0, 0, 0 };
};

/// Parse "#RRGGBB" (opaque) or "#AARRGGBB".
std::optional<Color> ParseColor(std::string_view text);

/// Parse INI-like `key = value` lines.
///
/// * Keys: `color_low`, `color_medium`, `color_high`.
/// * Lines starting with ';' are comments.
///
/// Malformed lines and unknown keys are logged and skipped.
DialConfig ParseDialConfig(std::string_view text);

/// Load and parse a config asset. Falls back to `DialConfig{}` if the asset cannot be read.
DialConfig LoadDialConfig(IAssetManager& asset_manager, char const* asset_path);

} // namespace fandial
