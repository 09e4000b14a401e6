#pragma once

#include "ui/Gauge.hpp"
#include "ui/Theme.hpp"
#include "util/TomlReader.hpp"
#include <string>
#include <vector>

namespace paceline::ui {

struct Config {
  struct ThemeConfig {
    std::string name;
    std::string truecolor;       // auto|true|false
    ThemeOverrides overrides;    // [colors]
  } theme;

  struct GaugeConfig {
    GaugeStyle five_hour_style{GaugeStyle::Blocks};
    GaugeStyle seven_day_style{GaugeStyle::Vertical};
    int five_hour_width{8};
    int seven_day_width{8};
    int max_width{kDefaultMaxGaugeWidth};
    int context_width{10};
  } gauge;

  struct ForecastConfig {
    double half_trust_hours{16.0};
    double relevance_coeff{1.4};
    bool show_ratio{false};
  } forecast;

  struct LineConfig {
    std::string segments;
    std::string separator;
    int max_cols{0};             // 0 => unlimited
  } line;

  bool debug{false};
};

// TOML -> env -> compiled default for every key. Problems found along the
// way are appended to `warnings` (never fatal).
[[nodiscard]] Config load_config(const paceline::util::TomlReader& toml, bool have_toml,
                                 std::vector<std::string>* warnings = nullptr);

// Process-wide config, loaded once from config_file_path(); warnings go to stderr.
const Config& config();
[[nodiscard]] std::string config_file_path();

// "auto" defers to COLORTERM.
[[nodiscard]] bool resolve_truecolor(const std::string& mode);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);

} // namespace paceline::ui
