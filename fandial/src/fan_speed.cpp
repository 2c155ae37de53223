// TU header --------------------------------------------
#include "fan_speed.h"

namespace fandial {

FanSpeed Next(FanSpeed speed) {
  switch (speed) {
  case FanSpeed::kOff:    return FanSpeed::kLow;
  case FanSpeed::kLow:    return FanSpeed::kMedium;
  case FanSpeed::kMedium: return FanSpeed::kHigh;
  case FanSpeed::kHigh:   return FanSpeed::kOff;
  }
  return FanSpeed::kOff;
}

uint32_t GetOrdinal(FanSpeed speed) {
  return static_cast<uint32_t>(speed);
}

TextId GetLabelTextId(FanSpeed speed) {
  switch (speed) {
  case FanSpeed::kOff:    return TextId::kFanOff;
  case FanSpeed::kLow:    return TextId::kFanLow;
  case FanSpeed::kMedium: return TextId::kFanMedium;
  case FanSpeed::kHigh:   return TextId::kFanHigh;
  }
  return TextId::kFanOff;
}

char const* GetFanSpeedName(FanSpeed speed) {
  switch (speed) {
  case FanSpeed::kOff:    return "OFF";
  case FanSpeed::kLow:    return "LOW";
  case FanSpeed::kMedium: return "MEDIUM";
  case FanSpeed::kHigh:   return "HIGH";
  }
  return "???";
}

} // namespace fandial
