#pragma once

#include "model/Usage.hpp"
#include "ui/Color.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paceline::ui {

enum class Role {
  Text, Muted, Accent, Separator,
  Ahead, OnTrack, Caution, Critical,
  GaugeEmpty, BadgeFg, BadgeBg,
};
inline constexpr size_t kRoleCount = 11;

[[nodiscard]] const char* role_name(Role r);
[[nodiscard]] std::optional<Role> role_from_name(std::string_view name);

struct GradientStop {
  double threshold;   // stop applies to pct strictly below this value
  Color color;
};

struct Theme {
  std::string name;
  std::array<Color, kRoleCount> roles{};
  std::vector<GradientStop> gradient;  // strictly increasing, last > 100
  Color floor;                         // past the last threshold

  const Color& role(Role r) const { return roles[static_cast<size_t>(r)]; }
  Color& role(Role r) { return roles[static_cast<size_t>(r)]; }
};

// (key, "#RRGGBB") pairs. Keys: role names, gradient_<n> (1-based), gradient_floor.
using ThemeOverrides = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char* kCustomThemeName = "custom";

// Built-in themes (read-only table)
[[nodiscard]] const Theme* find_theme(std::string_view name);
[[nodiscard]] std::vector<std::string> theme_names();

[[nodiscard]] bool validate_gradient(const Theme& t);

// First stop whose threshold exceeds pct, else the floor colour.
[[nodiscard]] const Color& gradient_color(const Theme& t, double pct);

// Copy of `base` with only the overridden keys replaced, named "custom".
// Keys that are unknown or carry malformed hex are appended to `rejected`.
[[nodiscard]] Theme merge_theme(const Theme& base, const ThemeOverrides& overrides,
                                std::vector<std::string>* rejected = nullptr);

// The active theme. Built once at startup and passed by const reference
// into every render call; never mutated afterwards.
class ResolvedTheme {
public:
  ResolvedTheme(Theme theme, bool truecolor);

  const std::string& name() const { return theme_.name; }
  bool truecolor() const { return truecolor_; }
  const Theme& theme() const { return theme_; }

  const Color& role(Role r) const { return theme_.role(r); }
  const Color& gradient(double pct) const { return gradient_color(theme_, pct); }

  std::string fg(Role r) const { return sgr_fg(role(r), truecolor_); }
  std::string bg(Role r) const { return sgr_bg(role(r), truecolor_); }
  std::string fg(const Color& c) const { return sgr_fg(c, truecolor_); }
  std::string bg(const Color& c) const { return sgr_bg(c, truecolor_); }
  std::string pair(Role bg_role, Role fg_role) const { return bg(bg_role) + fg(fg_role); }

  static Role tier_role(paceline::model::Tier t);

private:
  Theme theme_;
  bool truecolor_;
};

// Look up `base_name` (unknown => "default"), apply overrides when any are
// given, and fix the truecolor decision. Problems are described in `warnings`.
[[nodiscard]] ResolvedTheme resolve_theme(std::string_view base_name,
                                          const ThemeOverrides& overrides,
                                          bool truecolor,
                                          std::vector<std::string>* warnings = nullptr);

} // namespace paceline::ui
