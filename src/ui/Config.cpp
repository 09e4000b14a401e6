#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace paceline::ui {

namespace {

using paceline::util::TomlReader;

void warn(std::vector<std::string>* warnings, std::string msg) {
  if (warnings) warnings->push_back(std::move(msg));
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

// Resolve an int from TOML -> env -> compiled default
int resolve_int(const TomlReader& toml, bool have_toml,
                const char* section, const char* key,
                const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a double from TOML -> env -> compiled default
double resolve_double(const TomlReader& toml, bool have_toml,
                      const char* section, const char* key,
                      const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
bool resolve_bool(const TomlReader& toml, bool have_toml,
                  const char* section, const char* key,
                  const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
std::string resolve_string(const TomlReader& toml, bool have_toml,
                           const char* section, const char* key,
                           const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

GaugeStyle resolve_style(const TomlReader& toml, bool have_toml, const char* key,
                         const char* env_name, GaugeStyle def,
                         std::vector<std::string>* warnings) {
  std::string raw = resolve_string(toml, have_toml, "gauge", key, env_name, gauge_style_name(def));
  if (auto s = parse_gauge_style(raw)) return *s;
  warn(warnings, std::string("gauge.") + key + ": unknown style '" + raw + "'");
  return def;
}

int at_least(int v, int lo, int def, const char* what, std::vector<std::string>* warnings) {
  if (v >= lo) return v;
  warn(warnings, std::string(what) + ": " + std::to_string(v) + " is below " + std::to_string(lo));
  return def;
}

double positive(double v, double def, const char* what, std::vector<std::string>* warnings) {
  if (v > 0.0) return v;
  warn(warnings, std::string(what) + ": must be positive");
  return def;
}

} // namespace

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  // PACELINE_SHOW_RATIO <-> paceline_show_ratio
  if (n.rfind("PACELINE_", 0) == 0) {
    alt = paceline::util::ascii_lower_copy(n);
  } else if (n.rfind("paceline_", 0) == 0) {
    alt = n;
    for (auto& ch : alt) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stod(v); } catch (const std::exception&) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/paceline/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/paceline/config.toml";
  return {};
}

bool resolve_truecolor(const std::string& mode) {
  std::string m = paceline::util::ascii_lower_copy(mode);
  if (m == "true" || m == "on" || m == "1" || m == "yes") return true;
  if (m == "false" || m == "off" || m == "0" || m == "no") return false;
  return truecolor_capable();
}

Config load_config(const TomlReader& toml, bool have_toml, std::vector<std::string>* warnings) {
  Config c{};

  // --- [theme] / [colors] ---
  c.theme.name      = resolve_string(toml, have_toml, "theme", "name",      "PACELINE_THEME", "default");
  c.theme.truecolor = resolve_string(toml, have_toml, "theme", "truecolor", "PACELINE_TRUECOLOR", "auto");
  if (have_toml) c.theme.overrides = toml.entries("colors");

  // --- [gauge] ---
  const Config::GaugeConfig gd{};
  c.gauge.five_hour_style = resolve_style(toml, have_toml, "five_hour_style", "PACELINE_FIVE_HOUR_STYLE", gd.five_hour_style, warnings);
  c.gauge.seven_day_style = resolve_style(toml, have_toml, "seven_day_style", "PACELINE_SEVEN_DAY_STYLE", gd.seven_day_style, warnings);
  c.gauge.five_hour_width = at_least(resolve_int(toml, have_toml, "gauge", "five_hour_width", "PACELINE_FIVE_HOUR_WIDTH", gd.five_hour_width),
                                     2, gd.five_hour_width, "gauge.five_hour_width", warnings);
  c.gauge.seven_day_width = at_least(resolve_int(toml, have_toml, "gauge", "seven_day_width", "PACELINE_SEVEN_DAY_WIDTH", gd.seven_day_width),
                                     2, gd.seven_day_width, "gauge.seven_day_width", warnings);
  c.gauge.max_width       = at_least(resolve_int(toml, have_toml, "gauge", "max_width", nullptr, gd.max_width),
                                     2, gd.max_width, "gauge.max_width", warnings);
  c.gauge.context_width   = at_least(resolve_int(toml, have_toml, "gauge", "context_width", "PACELINE_CONTEXT_WIDTH", gd.context_width),
                                     0, gd.context_width, "gauge.context_width", warnings);

  // --- [forecast] ---
  const Config::ForecastConfig fd{};
  c.forecast.half_trust_hours = positive(resolve_double(toml, have_toml, "forecast", "half_trust_hours", "PACELINE_HALF_TRUST_HOURS", fd.half_trust_hours),
                                         fd.half_trust_hours, "forecast.half_trust_hours", warnings);
  c.forecast.relevance_coeff  = positive(resolve_double(toml, have_toml, "forecast", "relevance_coeff", "PACELINE_RELEVANCE_COEFF", fd.relevance_coeff),
                                         fd.relevance_coeff, "forecast.relevance_coeff", warnings);
  c.forecast.show_ratio       = resolve_bool(toml, have_toml, "forecast", "show_ratio", "PACELINE_SHOW_RATIO", fd.show_ratio);

  // --- [line] ---
  c.line.segments  = resolve_string(toml, have_toml, "line", "segments",  "PACELINE_SEGMENTS", "model,dir,context,five_hour,seven_day");
  c.line.separator = resolve_string(toml, have_toml, "line", "separator", nullptr, " │ ");
  c.line.max_cols  = at_least(resolve_int(toml, have_toml, "line", "max_cols", "PACELINE_MAX_COLS", 0),
                              0, 0, "line.max_cols", warnings);

  // --- [debug] ---
  c.debug = resolve_bool(toml, have_toml, "debug", "enabled", "PACELINE_DEBUG", false);

  return c;
}

const Config& config() {
  static Config cfg = []{
    TomlReader toml;
    auto path = config_file_path();
    bool have_toml = !path.empty() && toml.load(path);
    std::vector<std::string> warnings;
    Config c = load_config(toml, have_toml, &warnings);
    for (const auto& w : warnings)
      std::fprintf(stderr, "paceline: config: %s\n", w.c_str());
    return c;
  }();
  return cfg;
}

} // namespace paceline::ui
