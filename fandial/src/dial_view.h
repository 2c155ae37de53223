#pragma once

// c++ headers ------------------------------------------
#include <functional>
#include <string>

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "mbase/access.h"
#include "dial_config.h"
#include "dial_surface.h"
#include "fan_speed.h"

namespace fandial {

/// What the accessibility layer narrates for the dial.
struct AccessibilityInfo final {
  std::string description;  // Label of the current speed.
  std::string action_label; // "change", or "reset" once the dial is at HIGH.
};

/// Fan speed selector drawn as a disc with an indicator dot and four labels around it.
/// Each activation advances the speed OFF -> LOW -> MEDIUM -> HIGH -> OFF.
///
/// Single-threaded; the host drives `Resize()`, `Activate()` and `Render()` from its frame loop.
class DialView final {
public:
  using InvalidateCallback = std::function<void()>;

  static constexpr float kLabelFontSize = 55.0f;

  /// `invalidate` is called whenever the dial needs to be repainted. May be empty.
  DialView(DialConfig const& config, InvalidateCallback invalidate);
  ~DialView() = default;
  MBASE_DISALLOW_COPY_MOVE(DialView);

  /// Must be called whenever the widget bounds change, and once before the first `Render()`.
  void Resize(float width, float height);

  /// Advance to the next speed and request a repaint.
  ///
  /// `handled_upstream` is the outcome of the host's own dispatch for this event; if it
  /// already consumed the event the dial is left untouched.
  ///
  /// ## Returns
  /// Always true: the event is consumed.
  bool Activate(bool handled_upstream = false);

  /// Recompute the texts after the UI language changed.
  void RefreshText();

  void Render(ISurface& surface) const;

  /// True if `local_point` lies within the bounds given by the last `Resize()`.
  bool HitTest(raylib::Vector2 const& local_point) const;

  FanSpeed GetCurrentSpeed() const { return state_.current_speed; }
  float GetRadius() const { return state_.radius; }
  bool IsClickable() const { return clickable_; }

  std::string const& GetContentDescription() const { return accessibility_.description; }
  AccessibilityInfo const& GetAccessibilityInfo() const { return accessibility_; }

  /// Disc color for `speed` under this dial's configuration.
  Color GetFillColor(FanSpeed speed) const;

private:
  struct DialState final {
    FanSpeed current_speed = FanSpeed::kOff;
    float width = 0.0f;
    float height = 0.0f;
    float radius = 0.0f;
  };

  void UpdateAccessibility();
  void Invalidate() const;

  DialConfig const config_;
  InvalidateCallback invalidate_;

  DialState state_;
  AccessibilityInfo accessibility_;

  bool clickable_ = false;
};

} // namespace fandial
