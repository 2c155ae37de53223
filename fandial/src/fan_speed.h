#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <array>

// project headers --------------------------------------
#include "text.h"

namespace fandial {

/// Selectable fan speeds. The ordinal decides where a speed sits on the dial.
enum class FanSpeed : uint8_t {
  kOff,
  kLow,
  kMedium,
  kHigh,
};

constexpr uint32_t kFanSpeedCount = 4;

/// All speeds in ordinal order.
constexpr std::array<FanSpeed, kFanSpeedCount> kFanSpeeds = {
  FanSpeed::kOff,
  FanSpeed::kLow,
  FanSpeed::kMedium,
  FanSpeed::kHigh,
};

/// Successor in the cycle OFF -> LOW -> MEDIUM -> HIGH -> OFF.
FanSpeed Next(FanSpeed speed);

uint32_t GetOrdinal(FanSpeed speed);

/// Id of the display text for `speed`, resolved through `GetText()`.
TextId GetLabelTextId(FanSpeed speed);

/// Untranslated name for logs, e.g. "MEDIUM".
char const* GetFanSpeedName(FanSpeed speed);

} // namespace fandial
