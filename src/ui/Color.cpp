#include "ui/Color.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cmath>

namespace paceline::ui {

namespace {

constexpr int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};
constexpr int kCubeBase = 16;
constexpr int kGrayBase = 232;
constexpr int kGraySteps = 24;

// First minimal level wins on ties.
int nearest_cube_level(int v) {
  int best = 0;
  int best_d = std::abs(v - kCubeLevels[0]);
  for (int i = 1; i < 6; ++i) {
    int d = std::abs(v - kCubeLevels[i]);
    if (d < best_d) { best = i; best_d = d; }
  }
  return best;
}

int sq(int v) { return v * v; }

} // namespace

int quantize_rgb(const Rgb& in) {
  const int r = std::clamp(in.r, 0, 255);
  const int g = std::clamp(in.g, 0, 255);
  const int b = std::clamp(in.b, 0, 255);

  const int ri = nearest_cube_level(r);
  const int gi = nearest_cube_level(g);
  const int bi = nearest_cube_level(b);
  const int cube_idx = kCubeBase + 36 * ri + 6 * gi + bi;
  const int cube_d = sq(r - kCubeLevels[ri]) + sq(g - kCubeLevels[gi]) + sq(b - kCubeLevels[bi]);

  const double lum = 0.299 * r + 0.587 * g + 0.114 * b;
  int step = static_cast<int>(std::lround((lum - 8.0) / 10.0));
  step = std::clamp(step, 0, kGraySteps - 1);
  const int gray = 8 + 10 * step;
  const int gray_d = sq(r - gray) + sq(g - gray) + sq(b - gray);

  return gray_d < cube_d ? kGrayBase + step : cube_idx;
}

std::optional<Rgb> parse_hex_rgb(std::string_view hex) {
  if (!hex.empty() && hex[0] == '#') hex.remove_prefix(1);
  if (hex.size() != 6) return std::nullopt;
  auto hexv = [](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v[6];
  for (int i = 0; i < 6; ++i) {
    v[i] = hexv(hex[i]);
    if (v[i] < 0) return std::nullopt;
  }
  return Rgb{v[0]*16+v[1], v[2]*16+v[3], v[4]*16+v[5]};
}

Color color_from_hex(std::string_view hex, int fallback_if_malformed) {
  auto rgb = parse_hex_rgb(hex);
  if (!rgb) return Color{std::nullopt, std::clamp(fallback_if_malformed, 0, 255)};
  return Color{rgb, quantize_rgb(*rgb)};
}

std::string sgr_fg(const Color& c, bool truecolor) {
  if (truecolor && c.rgb) return sgr_truecolor(c.rgb->r, c.rgb->g, c.rgb->b);
  return sgr_palette_idx(c.fallback);
}

std::string sgr_bg(const Color& c, bool truecolor) {
  if (truecolor && c.rgb) return sgr_truecolor_bg(c.rgb->r, c.rgb->g, c.rgb->b);
  return sgr_palette_idx_bg(c.fallback);
}

} // namespace paceline::ui
