#pragma once

#include "ui/Theme.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace paceline::ui {

enum class GaugeStyle { Vertical, Blocks, None };

[[nodiscard]] std::optional<GaugeStyle> parse_gauge_style(std::string_view s);
[[nodiscard]] const char* gauge_style_name(GaugeStyle s);

inline constexpr int kDefaultMaxGaugeWidth = 128;

// Round down to even, clamp to [2, max_width].
[[nodiscard]] int normalize_block_width(int width, int max_width = kDefaultMaxGaugeWidth);

// Cell accounting for one half of the block gauge.
struct HalfFill {
  int full{0};
  int partial_eighths{0};  // 0 => no partial cell
  int empty{0};
  int partial_cells() const { return partial_eighths > 0 ? 1 : 0; }
};

// Left half grows leftwards from the centre while ahead of pace; right
// half grows rightwards from the centre while behind. At most one half
// is non-empty.
struct BlockLayout {
  int width{0};
  int half{0};
  HalfFill ahead;
  HalfFill behind;

  int filled_cells() const { return ahead.full + behind.full; }
  int partial_cells() const { return ahead.partial_cells() + behind.partial_cells(); }
  int empty_cells() const { return ahead.empty + behind.empty; }
};

// `width` must already be normalized (even, >= 2).
[[nodiscard]] BlockLayout block_layout(double ratio, int width);

// Single-cell gauge built from the bottom-filling eighth blocks.
[[nodiscard]] std::string render_vertical_gauge(double ratio, const ResolvedTheme& theme);

// Two-sided horizontal gauge; `width` is normalized internally.
[[nodiscard]] std::string render_block_gauge(double ratio, int width, const ResolvedTheme& theme,
                                             int max_width = kDefaultMaxGaugeWidth);

[[nodiscard]] std::string render_pace_gauge(GaugeStyle style, double ratio, int width,
                                            const ResolvedTheme& theme,
                                            int max_width = kDefaultMaxGaugeWidth);

// Left-to-right usage bar coloured by the theme gradient at pct (0..100).
[[nodiscard]] std::string render_usage_bar(double pct, int width, const ResolvedTheme& theme);

} // namespace paceline::ui
