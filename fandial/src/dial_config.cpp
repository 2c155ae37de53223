// TU header --------------------------------------------
#include "dial_config.h"

// c++ headers ------------------------------------------
#include <cstdint>

#include <charconv>
#include <string>
#include <vector>

// project headers --------------------------------------
#include "mbase/log.h"
#include "asset.h"

namespace fandial {

namespace {

std::string_view Trim(std::string_view s) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  size_t const first = s.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  size_t const last = s.find_last_not_of(kWhitespace);
  return s.substr(first, last - first + 1);
}

Color* FindColorSlot(DialConfig& config, std::string_view key) {
  if (key == "color_low") return &config.color_low;
  if (key == "color_medium") return &config.color_medium;
  if (key == "color_high") return &config.color_high;
  return nullptr;
}

} // namespace

std::optional<Color> ParseColor(std::string_view text) {
  text = Trim(text);
  if (text.empty() || text.front() != '#') {
    return std::nullopt;
  }
  text.remove_prefix(1);

  if (text.size() != 6 && text.size() != 8) {
    return std::nullopt;
  }

  uint32_t value = 0;
  auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }

  if (text.size() == 6) {
    value |= 0xFF000000u;
  }

  // 0xAARRGGBB
  return Color {
    static_cast<unsigned char>((value >> 16) & 0xFF),
    static_cast<unsigned char>((value >>  8) & 0xFF),
    static_cast<unsigned char>((value >>  0) & 0xFF),
    static_cast<unsigned char>((value >> 24) & 0xFF),
  };
}

DialConfig ParseDialConfig(std::string_view text) {
  DialConfig config;

  uint32_t line_number = 0;
  while (!text.empty()) {
    size_t const eol = text.find('\n');
    std::string_view const raw_line = text.substr(0, eol);
    text = (eol == std::string_view::npos) ? std::string_view() : text.substr(eol + 1);
    ++line_number;

    std::string_view const line = Trim(raw_line);
    if (line.empty() || line.front() == ';') {
      continue;
    }

    size_t const eq = line.find('=');
    if (eq == std::string_view::npos) {
      MBASE_LOG_WARN("dial config:{}: expected 'key = value', got '{}'", line_number, line);
      continue;
    }

    std::string_view const key = Trim(line.substr(0, eq));
    std::string_view const value = Trim(line.substr(eq + 1));

    Color* slot = FindColorSlot(config, key);
    if (slot == nullptr) {
      MBASE_LOG_WARN("dial config:{}: unknown key '{}'", line_number, key);
      continue;
    }

    std::optional<Color> const opt_color = ParseColor(value);
    if (!opt_color.has_value()) {
      MBASE_LOG_WARN("dial config:{}: invalid color '{}' for '{}'", line_number, value, key);
      continue;
    }
    *slot = opt_color.value();
  }

  return config;
}

DialConfig LoadDialConfig(IAssetManager& asset_manager, char const* asset_path) {
  std::optional<std::vector<std::byte>> opt_bytes = asset_manager.LoadAsset(asset_path);
  if (!opt_bytes.has_value()) {
    MBASE_LOG_WARN("Dial config '{}' not found; all speed colors are transparent.", asset_path);
    return DialConfig {};
  }

  std::string_view const text(reinterpret_cast<char const*>(opt_bytes->data()), opt_bytes->size());
  return ParseDialConfig(text);
}

} // namespace fandial
