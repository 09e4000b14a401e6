#include "ui/Theme.hpp"
#include <charconv>
#include <iterator>
#include <string>

namespace paceline::ui {

namespace {

struct RoleNameDef { const char* name; Role role; };
constexpr RoleNameDef role_names[] = {
  {"text",        Role::Text},
  {"muted",       Role::Muted},
  {"accent",      Role::Accent},
  {"separator",   Role::Separator},
  {"ahead",       Role::Ahead},
  {"on_track",    Role::OnTrack},
  {"caution",     Role::Caution},
  {"critical",    Role::Critical},
  {"gauge_empty", Role::GaugeEmpty},
  {"badge_fg",    Role::BadgeFg},
  {"badge_bg",    Role::BadgeBg},
};
static_assert(std::size(role_names) == kRoleCount);

// Built-in colours carry hand-checked palette indices.
Color C(int r, int g, int b, int idx) { return Color{Rgb{r, g, b}, idx}; }
Color P(int idx) { return Color{std::nullopt, idx}; }

Theme make_default() {
  Theme t;
  t.name = "default";
  t.role(Role::Text)       = C(0xD0, 0xD0, 0xD0, 252);
  t.role(Role::Muted)      = C(0x80, 0x80, 0x80, 244);
  t.role(Role::Accent)     = C(0x5F, 0xAF, 0xFF, 75);
  t.role(Role::Separator)  = C(0x4E, 0x4E, 0x4E, 239);
  t.role(Role::Ahead)      = C(0x00, 0xAF, 0xAF, 37);
  t.role(Role::OnTrack)    = C(0x5F, 0xD7, 0x5F, 77);
  t.role(Role::Caution)    = C(0xFF, 0xD7, 0x5F, 221);
  t.role(Role::Critical)   = C(0xFF, 0x5F, 0x5F, 203);
  t.role(Role::GaugeEmpty) = C(0x30, 0x30, 0x30, 236);
  t.role(Role::BadgeFg)    = C(0x1C, 0x1C, 0x1C, 234);
  t.role(Role::BadgeBg)    = C(0x5F, 0xAF, 0xFF, 75);
  t.gradient = {
    {50.0,  C(0x5F, 0xD7, 0x5F, 77)},
    {70.0,  C(0xD7, 0xD7, 0x5F, 185)},
    {85.0,  C(0xFF, 0xAF, 0x5F, 215)},
    {101.0, C(0xFF, 0x5F, 0x5F, 203)},
  };
  t.floor = C(0xD7, 0x00, 0x00, 160);
  return t;
}

Theme make_ocean() {
  Theme t;
  t.name = "ocean";
  t.role(Role::Text)       = C(0xD7, 0xD7, 0xFF, 189);
  t.role(Role::Muted)      = C(0x87, 0x87, 0xAF, 103);
  t.role(Role::Accent)     = C(0x5F, 0xD7, 0xFF, 81);
  t.role(Role::Separator)  = C(0x5F, 0x5F, 0x87, 60);
  t.role(Role::Ahead)      = C(0x00, 0xD7, 0xD7, 44);
  t.role(Role::OnTrack)    = C(0x5F, 0xD7, 0xAF, 79);
  t.role(Role::Caution)    = C(0xFF, 0xD7, 0x87, 222);
  t.role(Role::Critical)   = C(0xFF, 0x5F, 0x87, 204);
  t.role(Role::GaugeEmpty) = C(0x26, 0x26, 0x26, 235);
  t.role(Role::BadgeFg)    = C(0x12, 0x12, 0x12, 233);
  t.role(Role::BadgeBg)    = C(0x5F, 0xD7, 0xFF, 81);
  t.gradient = {
    {60.0,  C(0x5F, 0xD7, 0xAF, 79)},
    {80.0,  C(0xFF, 0xD7, 0x87, 222)},
    {101.0, C(0xFF, 0x5F, 0x87, 204)},
  };
  t.floor = C(0xFF, 0x00, 0x5F, 197);
  return t;
}

Theme make_ember() {
  Theme t;
  t.name = "ember";
  t.role(Role::Text)       = C(0xFF, 0xD7, 0xAF, 223);
  t.role(Role::Muted)      = C(0xAF, 0x87, 0x87, 138);
  t.role(Role::Accent)     = C(0xFF, 0xAF, 0x00, 214);
  t.role(Role::Separator)  = C(0x5F, 0x5F, 0x5F, 59);
  t.role(Role::Ahead)      = C(0x87, 0xD7, 0xAF, 115);
  t.role(Role::OnTrack)    = C(0xAF, 0xD7, 0x5F, 149);
  t.role(Role::Caution)    = C(0xFF, 0xAF, 0x5F, 215);
  t.role(Role::Critical)   = C(0xD7, 0x5F, 0x5F, 167);
  t.role(Role::GaugeEmpty) = C(0x3A, 0x3A, 0x3A, 237);
  t.role(Role::BadgeFg)    = C(0x1C, 0x1C, 0x1C, 234);
  t.role(Role::BadgeBg)    = C(0xFF, 0xAF, 0x00, 214);
  t.gradient = {
    {50.0,  C(0xAF, 0xD7, 0x5F, 149)},
    {75.0,  C(0xFF, 0xAF, 0x00, 214)},
    {90.0,  C(0xFF, 0x87, 0x00, 208)},
    {101.0, C(0xD7, 0x5F, 0x5F, 167)},
  };
  t.floor = C(0xAF, 0x00, 0x00, 124);
  return t;
}

// Palette-only: renders identically with or without truecolor.
Theme make_mono() {
  Theme t;
  t.name = "mono";
  t.role(Role::Text)       = P(252);
  t.role(Role::Muted)      = P(245);
  t.role(Role::Accent)     = P(255);
  t.role(Role::Separator)  = P(240);
  t.role(Role::Ahead)      = P(250);
  t.role(Role::OnTrack)    = P(248);
  t.role(Role::Caution)    = P(253);
  t.role(Role::Critical)   = P(231);
  t.role(Role::GaugeEmpty) = P(236);
  t.role(Role::BadgeFg)    = P(232);
  t.role(Role::BadgeBg)    = P(250);
  t.gradient = {
    {70.0,  P(248)},
    {90.0,  P(252)},
    {101.0, P(231)},
  };
  t.floor = P(231);
  return t;
}

const std::vector<Theme>& builtin_themes() {
  static const std::vector<Theme> themes = {
    make_default(), make_ocean(), make_ember(), make_mono(),
  };
  return themes;
}

// "gradient_3" -> 2 (zero-based); nullopt when not a gradient stop key.
std::optional<size_t> gradient_stop_index(std::string_view key) {
  constexpr std::string_view prefix = "gradient_";
  if (key.substr(0, prefix.size()) != prefix) return std::nullopt;
  auto digits = key.substr(prefix.size());
  if (digits.empty()) return std::nullopt;
  size_t n = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || n == 0) return std::nullopt;
  return n - 1;
}

} // namespace

const char* role_name(Role r) {
  for (const auto& def : role_names)
    if (def.role == r) return def.name;
  return "text";
}

std::optional<Role> role_from_name(std::string_view name) {
  for (const auto& def : role_names)
    if (name == def.name) return def.role;
  return std::nullopt;
}

const Theme* find_theme(std::string_view name) {
  for (const auto& t : builtin_themes())
    if (t.name == name) return &t;
  return nullptr;
}

std::vector<std::string> theme_names() {
  std::vector<std::string> out;
  for (const auto& t : builtin_themes()) out.push_back(t.name);
  return out;
}

bool validate_gradient(const Theme& t) {
  if (t.gradient.empty()) return false;
  for (size_t i = 1; i < t.gradient.size(); ++i)
    if (!(t.gradient[i].threshold > t.gradient[i - 1].threshold)) return false;
  return t.gradient.back().threshold > 100.0;
}

const Color& gradient_color(const Theme& t, double pct) {
  for (const auto& stop : t.gradient)
    if (stop.threshold > pct) return stop.color;
  return t.floor;
}

Theme merge_theme(const Theme& base, const ThemeOverrides& overrides,
                  std::vector<std::string>* rejected) {
  Theme out = base;
  out.name = kCustomThemeName;
  auto reject = [&](const std::string& key){ if (rejected) rejected->push_back(key); };

  for (const auto& [key, hex] : overrides) {
    Color* slot = nullptr;
    if (auto role = role_from_name(key)) {
      slot = &out.role(*role);
    } else if (key == "gradient_floor") {
      slot = &out.floor;
    } else if (auto idx = gradient_stop_index(key); idx && *idx < out.gradient.size()) {
      slot = &out.gradient[*idx].color;
    }
    if (!slot) { reject(key); continue; }

    Color c = color_from_hex(hex, slot->fallback);
    if (!c.rgb) reject(key);
    *slot = c;
  }
  return out;
}

ResolvedTheme::ResolvedTheme(Theme theme, bool truecolor)
    : theme_(std::move(theme)), truecolor_(truecolor) {}

Role ResolvedTheme::tier_role(paceline::model::Tier t) {
  using paceline::model::Tier;
  switch (t) {
    case Tier::Ahead:    return Role::Ahead;
    case Tier::OnTrack:  return Role::OnTrack;
    case Tier::Caution:  return Role::Caution;
    case Tier::Critical: return Role::Critical;
  }
  return Role::Critical;
}

ResolvedTheme resolve_theme(std::string_view base_name, const ThemeOverrides& overrides,
                            bool truecolor, std::vector<std::string>* warnings) {
  auto warn = [&](std::string msg){ if (warnings) warnings->push_back(std::move(msg)); };

  const Theme* base = find_theme(base_name);
  if (!base) {
    warn("unknown theme '" + std::string(base_name) + "', using default");
    base = find_theme("default");
  }
  if (overrides.empty()) return ResolvedTheme(*base, truecolor);

  std::vector<std::string> rejected;
  Theme merged = merge_theme(*base, overrides, &rejected);
  for (const auto& key : rejected)
    warn("ignoring colour override '" + key + "'");
  if (!validate_gradient(merged)) {
    warn("custom theme has an invalid gradient, using '" + base->name + "'");
    return ResolvedTheme(*base, truecolor);
  }
  return ResolvedTheme(std::move(merged), truecolor);
}

} // namespace paceline::ui
