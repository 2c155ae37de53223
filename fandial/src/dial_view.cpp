// TU header --------------------------------------------
#include "dial_view.h"

// c++ headers ------------------------------------------
#include <utility>

// project headers --------------------------------------
#include "mbase/log.h"
#include "dial_geometry.h"
#include "text.h"

namespace fandial {

DialView::DialView(DialConfig const& config, InvalidateCallback invalidate)
  : config_(config)
  , invalidate_(std::move(invalidate))
{
  clickable_ = true;
  UpdateAccessibility();
}

void DialView::Resize(float width, float height) {
  state_.width = width;
  state_.height = height;
  state_.radius = ComputeRadius(width, height);
}

bool DialView::Activate(bool handled_upstream) {
  if (handled_upstream) {
    return true;
  }

  state_.current_speed = Next(state_.current_speed);
  UpdateAccessibility();
  Invalidate();

  MBASE_LOG_INFO("Fan speed -> {} ({})", GetFanSpeedName(state_.current_speed), accessibility_.description);
  return true;
}

void DialView::RefreshText() {
  UpdateAccessibility();
  Invalidate();
}

void DialView::Render(ISurface& surface) const {
  raylib::Vector2 const size = surface.GetSize();
  raylib::Vector2 const center { size.x / 2.0f, size.y / 2.0f };
  float const radius = state_.radius;

  // Dial.
  surface.DrawFilledCircle(center, radius, GetFillColor(state_.current_speed));

  // Indicator.
  raylib::Vector2 const marker_position = PositionForSpeed(
    state_.current_speed,
    radius + kRadiusOffsetIndicator,
    center
  );
  surface.DrawFilledCircle(marker_position, radius / 12.0f, BLACK);

  // Labels, in ordinal order regardless of the current speed.
  float const label_radius = radius + kRadiusOffsetLabel;
  for (FanSpeed speed : kFanSpeeds) {
    raylib::Vector2 const label_position = PositionForSpeed(speed, label_radius, center);
    surface.DrawCenteredText(
      GetText(GetLabelTextId(speed)),
      label_position,
      BLACK,
      kLabelFontSize,
      FontWeight::kBold
    );
  }
}

bool DialView::HitTest(raylib::Vector2 const& local_point) const {
  return local_point.x >= 0.0f && local_point.y >= 0.0f
    && local_point.x < state_.width && local_point.y < state_.height;
}

Color DialView::GetFillColor(FanSpeed speed) const {
  switch (speed) {
  case FanSpeed::kOff:    return GRAY;
  case FanSpeed::kLow:    return config_.color_low;
  case FanSpeed::kMedium: return config_.color_medium;
  case FanSpeed::kHigh:   return config_.color_high;
  }
  return GRAY;
}

void DialView::UpdateAccessibility() {
  accessibility_.description = GetText(GetLabelTextId(state_.current_speed));
  accessibility_.action_label = GetText(
    (state_.current_speed == FanSpeed::kHigh) ? TextId::kReset : TextId::kChange
  );
}

void DialView::Invalidate() const {
  if (invalidate_) {
    invalidate_();
  }
}

} // namespace fandial
