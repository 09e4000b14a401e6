#include "ui/Gauge.hpp"
#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace paceline::ui {

using paceline::model::Tier;
using paceline::model::classify_tier;

namespace {

// Index i covers (i+1)/8 of the cell from the bottom.
constexpr const char* kBottomEighths[8] = {
  "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█",
};

// Index p covers p/8 of the cell from the left; 0 is blank, 8 is full.
constexpr const char* kLeftEighths[9] = {
  " ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█",
};

struct Cell {
  const char* glyph;
  Color fg;
  Color bg;
};

// Consecutive cells sharing colours share one SGR pair; always reset at the end.
std::string serialize(const std::vector<Cell>& cells, const ResolvedTheme& theme) {
  if (cells.empty()) return {};
  std::string out;
  out.reserve(cells.size() * 8 + 48);
  const Cell* prev = nullptr;
  for (const auto& c : cells) {
    if (!prev || !(prev->fg == c.fg) || !(prev->bg == c.bg)) {
      out += theme.bg(c.bg);
      out += theme.fg(c.fg);
    }
    out += c.glyph;
    prev = &c;
  }
  out += sgr_reset();
  return out;
}

int eighth_index(double magnitude) {
  return std::clamp(static_cast<int>(std::floor(magnitude * 7.99)), 0, 7);
}

double sanitize_ratio(double ratio) {
  return ratio >= 0.0 ? ratio : 0.0;  // also maps NaN to 0
}

HalfFill fill_half(double magnitude, int half) {
  HalfFill h;
  int units = static_cast<int>(std::lround(magnitude * half * 8));
  units = std::clamp(units, 0, half * 8);
  h.full = units / 8;
  h.partial_eighths = units % 8;
  h.empty = half - h.full - h.partial_cells();
  return h;
}

const Color& tier_color(double ratio, const ResolvedTheme& theme) {
  return theme.role(ResolvedTheme::tier_role(classify_tier(ratio)));
}

} // namespace

std::optional<GaugeStyle> parse_gauge_style(std::string_view s) {
  std::string v = paceline::util::ascii_lower_copy(std::string(s));
  if (v == "vertical" || v == "bar") return GaugeStyle::Vertical;
  if (v == "blocks" || v == "block" || v == "horizontal") return GaugeStyle::Blocks;
  if (v == "none" || v == "off") return GaugeStyle::None;
  return std::nullopt;
}

const char* gauge_style_name(GaugeStyle s) {
  switch (s) {
    case GaugeStyle::Vertical: return "vertical";
    case GaugeStyle::Blocks:   return "blocks";
    case GaugeStyle::None:     return "none";
  }
  return "none";
}

int normalize_block_width(int width, int max_width) {
  int hi = std::max(2, max_width - (max_width % 2));
  width -= width % 2;
  return std::clamp(width, 2, hi);
}

BlockLayout block_layout(double ratio, int width) {
  ratio = sanitize_ratio(ratio);
  BlockLayout l;
  l.width = width;
  l.half = width / 2;
  double ahead = ratio > 1.0 ? std::min(1.0, ratio - 1.0) : 0.0;
  double behind = ratio < 1.0 ? std::min(1.0, 1.0 - ratio) : 0.0;
  l.ahead = fill_half(ahead, l.half);
  l.behind = fill_half(behind, l.half);
  return l;
}

std::string render_vertical_gauge(double ratio, const ResolvedTheme& theme) {
  ratio = sanitize_ratio(ratio);
  const Color& fill = tier_color(ratio, theme);
  const Color& empty = theme.role(Role::GaugeEmpty);

  if (ratio >= 1.0) {
    // Top-fill: the glyph is painted in the empty colour over an ahead
    // background, so the complement of index i reads as i/8 from the top.
    int i = eighth_index(std::min(1.0, ratio - 1.0));
    const char* glyph = i > 0 ? kBottomEighths[7 - i] : kBottomEighths[7];
    return serialize({Cell{glyph, empty, fill}}, theme);
  }
  int i = eighth_index(std::min(1.0, 1.0 - ratio));
  return serialize({Cell{kBottomEighths[i], fill, empty}}, theme);
}

std::string render_block_gauge(double ratio, int width, const ResolvedTheme& theme, int max_width) {
  ratio = sanitize_ratio(ratio);
  BlockLayout l = block_layout(ratio, normalize_block_width(width, max_width));
  const Color& fill = tier_color(ratio, theme);
  const Color& empty = theme.role(Role::GaugeEmpty);

  std::vector<Cell> cells;
  cells.reserve(static_cast<size_t>(l.width));

  // Left half: blank, then the partial, then full cells against the centre.
  // The partial uses the left-anchored ramp inverted to fill from the right.
  for (int i = 0; i < l.ahead.empty; ++i) cells.push_back({" ", empty, empty});
  if (l.ahead.partial_eighths > 0)
    cells.push_back({kLeftEighths[8 - l.ahead.partial_eighths], empty, fill});
  for (int i = 0; i < l.ahead.full; ++i) cells.push_back({" ", empty, fill});

  // Right half: full cells from the centre, the partial, then blank.
  for (int i = 0; i < l.behind.full; ++i) cells.push_back({kLeftEighths[8], fill, empty});
  if (l.behind.partial_eighths > 0)
    cells.push_back({kLeftEighths[l.behind.partial_eighths], fill, empty});
  for (int i = 0; i < l.behind.empty; ++i) cells.push_back({" ", empty, empty});

  return serialize(cells, theme);
}

std::string render_pace_gauge(GaugeStyle style, double ratio, int width,
                              const ResolvedTheme& theme, int max_width) {
  switch (style) {
    case GaugeStyle::Vertical: return render_vertical_gauge(ratio, theme);
    case GaugeStyle::Blocks:   return render_block_gauge(ratio, width, theme, max_width);
    case GaugeStyle::None:     return {};
  }
  return {};
}

std::string render_usage_bar(double pct, int width, const ResolvedTheme& theme) {
  if (width <= 0) return {};
  if (!(pct >= 0.0)) pct = 0.0;
  const Color& fill = theme.gradient(pct);
  const Color& empty = theme.role(Role::GaugeEmpty);

  int units = static_cast<int>(std::lround(std::min(pct, 100.0) / 100.0 * width * 8));
  units = std::clamp(units, 0, width * 8);
  int full = units / 8;
  int partial = units % 8;

  std::vector<Cell> cells;
  cells.reserve(static_cast<size_t>(width));
  for (int i = 0; i < full; ++i) cells.push_back({kLeftEighths[8], fill, empty});
  if (partial > 0) cells.push_back({kLeftEighths[partial], fill, empty});
  while (static_cast<int>(cells.size()) < width) cells.push_back({" ", fill, empty});
  return serialize(cells, theme);
}

} // namespace paceline::ui
