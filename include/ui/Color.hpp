#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paceline::ui {

struct Rgb {
  int r{0}, g{0}, b{0};
  bool operator==(const Rgb&) const = default;
};

// A theme colour: 24-bit value when known, plus a 256-palette index that
// is always valid and used whenever truecolor is off or rgb is absent.
struct Color {
  std::optional<Rgb> rgb;
  int fallback{0};
  bool operator==(const Color&) const = default;
};

// Nearest xterm-256 index (16..255) for an RGB triple.
[[nodiscard]] int quantize_rgb(const Rgb& c);

// "#RRGGBB" or "RRGGBB", case-insensitive. Anything else => nullopt.
[[nodiscard]] std::optional<Rgb> parse_hex_rgb(std::string_view hex);

// Colour from hex with its quantized fallback; a malformed string yields
// an absent rgb carrying `fallback_if_malformed`.
[[nodiscard]] Color color_from_hex(std::string_view hex, int fallback_if_malformed);

[[nodiscard]] std::string sgr_fg(const Color& c, bool truecolor);
[[nodiscard]] std::string sgr_bg(const Color& c, bool truecolor);

} // namespace paceline::ui
