#include "minitest.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using paceline::ui::Config;
using paceline::ui::GaugeStyle;
using paceline::ui::load_config;
using paceline::util::TomlReader;

static const char* const kEnvNames[] = {
  "THEME", "TRUECOLOR", "FIVE_HOUR_STYLE", "SEVEN_DAY_STYLE", "FIVE_HOUR_WIDTH",
  "SEVEN_DAY_WIDTH", "CONTEXT_WIDTH", "HALF_TRUST_HOURS", "RELEVANCE_COEFF",
  "SHOW_RATIO", "SEGMENTS", "MAX_COLS", "DEBUG",
};

static void clear_env() {
  for (const char* n : kEnvNames) {
    unsetenv((std::string("PACELINE_") + n).c_str());
    unsetenv((std::string("paceline_") + n).c_str());
  }
}

TEST(config_defaults_without_file) {
  clear_env();
  TomlReader toml;
  std::vector<std::string> warnings;
  Config c = load_config(toml, false, &warnings);
  ASSERT_TRUE(warnings.empty());
  ASSERT_EQ(c.theme.name, std::string("default"));
  ASSERT_EQ(c.theme.truecolor, std::string("auto"));
  ASSERT_TRUE(c.theme.overrides.empty());
  ASSERT_EQ(c.gauge.five_hour_style, GaugeStyle::Blocks);
  ASSERT_EQ(c.gauge.seven_day_style, GaugeStyle::Vertical);
  ASSERT_EQ(c.gauge.five_hour_width, 8);
  ASSERT_EQ(c.gauge.max_width, 128);
  ASSERT_NEAR(c.forecast.half_trust_hours, 16.0, 1e-12);
  ASSERT_NEAR(c.forecast.relevance_coeff, 1.4, 1e-12);
  ASSERT_EQ(c.forecast.show_ratio, false);
  ASSERT_EQ(c.line.segments, std::string("model,dir,context,five_hour,seven_day"));
  ASSERT_EQ(c.line.separator, std::string(" │ "));
  ASSERT_EQ(c.line.max_cols, 0);
  ASSERT_EQ(c.debug, false);
}

TEST(config_reads_every_section) {
  clear_env();
  TomlReader toml;
  toml.load_text(
    "[theme]\n"
    "name = \"ocean\"\n"
    "truecolor = false\n"
    "\n"
    "[colors]\n"
    "accent = \"#FF0000\"\n"
    "gradient_floor = #00FF00\n"
    "\n"
    "[gauge]\n"
    "five_hour_style = \"vertical\"\n"
    "seven_day_style = none\n"
    "five_hour_width = 12\n"
    "context_width = 6\n"
    "\n"
    "[forecast]\n"
    "half_trust_hours = 8.5\n"
    "relevance_coeff = 1.2\n"
    "show_ratio = true\n"
    "\n"
    "[line]\n"
    "separator = \" | \"\n"
    "max_cols = 60\n"
    "\n"
    "[debug]\n"
    "enabled = true\n"
  );
  std::vector<std::string> warnings;
  Config c = load_config(toml, true, &warnings);
  ASSERT_TRUE(warnings.empty());
  ASSERT_EQ(c.theme.name, std::string("ocean"));
  ASSERT_EQ(c.theme.truecolor, std::string("false"));
  ASSERT_EQ(c.theme.overrides.size(), 2u);
  ASSERT_EQ(c.theme.overrides[0].first, std::string("accent"));
  ASSERT_EQ(c.theme.overrides[0].second, std::string("#FF0000"));
  ASSERT_EQ(c.theme.overrides[1].second, std::string("#00FF00"));
  ASSERT_EQ(c.gauge.five_hour_style, GaugeStyle::Vertical);
  ASSERT_EQ(c.gauge.seven_day_style, GaugeStyle::None);
  ASSERT_EQ(c.gauge.five_hour_width, 12);
  ASSERT_EQ(c.gauge.context_width, 6);
  ASSERT_NEAR(c.forecast.half_trust_hours, 8.5, 1e-12);
  ASSERT_NEAR(c.forecast.relevance_coeff, 1.2, 1e-12);
  ASSERT_EQ(c.forecast.show_ratio, true);
  ASSERT_EQ(c.line.separator, std::string(" | "));
  ASSERT_EQ(c.line.max_cols, 60);
  ASSERT_EQ(c.debug, true);
  ASSERT_EQ(paceline::ui::resolve_truecolor(c.theme.truecolor), false);
}

TEST(config_bad_values_fall_back_with_warnings) {
  clear_env();
  TomlReader toml;
  toml.load_text(
    "[gauge]\n"
    "five_hour_style = diagonal\n"
    "five_hour_width = 1\n"
    "max_width = 0\n"
    "[forecast]\n"
    "relevance_coeff = -1\n"
    "half_trust_hours = 0\n"
    "[line]\n"
    "max_cols = -3\n"
  );
  std::vector<std::string> warnings;
  Config c = load_config(toml, true, &warnings);
  ASSERT_EQ(warnings.size(), 6u);
  ASSERT_EQ(c.gauge.five_hour_style, GaugeStyle::Blocks);
  ASSERT_EQ(c.gauge.five_hour_width, 8);
  ASSERT_EQ(c.gauge.max_width, 128);
  ASSERT_NEAR(c.forecast.relevance_coeff, 1.4, 1e-12);
  ASSERT_NEAR(c.forecast.half_trust_hours, 16.0, 1e-12);
  ASSERT_EQ(c.line.max_cols, 0);
}

TEST(config_unparseable_numbers_use_defaults) {
  clear_env();
  TomlReader toml;
  toml.load_text("[forecast]\nhalf_trust_hours = soon\n[gauge]\nseven_day_width = wide\n");
  Config c = load_config(toml, true);
  ASSERT_NEAR(c.forecast.half_trust_hours, 16.0, 1e-12);
  ASSERT_EQ(c.gauge.seven_day_width, 8);
}

TEST(truecolor_modes) {
  ASSERT_EQ(paceline::ui::resolve_truecolor("true"), true);
  ASSERT_EQ(paceline::ui::resolve_truecolor("ON"), true);
  ASSERT_EQ(paceline::ui::resolve_truecolor("off"), false);
  ASSERT_EQ(paceline::ui::resolve_truecolor("0"), false);
}

TEST(env_fills_keys_missing_from_file) {
  clear_env();
  setenv("PACELINE_THEME", "ember", 1);
  setenv("PACELINE_FIVE_HOUR_STYLE", "none", 1);
  setenv("PACELINE_FIVE_HOUR_WIDTH", "12", 1);
  setenv("PACELINE_MAX_COLS", "70", 1);
  TomlReader toml;
  toml.load_text("[gauge]\nfive_hour_width = 6\n");
  Config c = load_config(toml, true);
  ASSERT_EQ(c.theme.name, std::string("ember"));
  ASSERT_EQ(c.gauge.five_hour_style, GaugeStyle::None);
  ASSERT_EQ(c.gauge.five_hour_width, 6);
  ASSERT_EQ(c.line.max_cols, 70);

  toml.load_text("[theme]\nname = ocean\n");
  ASSERT_EQ(load_config(toml, true).theme.name, std::string("ocean"));
  // Without a file the whole environment applies
  Config e = load_config(toml, false);
  ASSERT_EQ(e.theme.name, std::string("ember"));
  ASSERT_EQ(e.gauge.five_hour_width, 12);
  clear_env();
}

TEST(env_lowercase_alias) {
  clear_env();
  setenv("paceline_show_ratio", "1", 1);
  setenv("paceline_segments", "7d,model", 1);
  ASSERT_TRUE(paceline::ui::getenv_compat("PACELINE_SHOW_RATIO") != nullptr);
  ASSERT_EQ(std::strcmp(paceline::ui::getenv_compat("PACELINE_SHOW_RATIO"), "1"), 0);
  TomlReader toml;
  Config c = load_config(toml, false);
  ASSERT_EQ(c.forecast.show_ratio, true);
  ASSERT_EQ(c.line.segments, std::string("7d,model"));

  // The canonical spelling wins when both are set
  setenv("PACELINE_SEGMENTS", "dir", 1);
  ASSERT_EQ(load_config(toml, false).line.segments, std::string("dir"));
  setenv("PACELINE_SHOW_RATIO", "no", 1);
  ASSERT_EQ(load_config(toml, false).forecast.show_ratio, false);
  clear_env();
  ASSERT_TRUE(paceline::ui::getenv_compat("PACELINE_SHOW_RATIO") == nullptr);
}

TEST(env_doubles_and_ints) {
  clear_env();
  setenv("PACELINE_RELEVANCE_COEFF", "1.1", 1);
  setenv("PACELINE_HALF_TRUST_HOURS", "abc", 1);
  setenv("PACELINE_SEVEN_DAY_WIDTH", "wide", 1);
  ASSERT_NEAR(paceline::ui::getenv_double("PACELINE_RELEVANCE_COEFF", 9.0), 1.1, 1e-12);
  ASSERT_NEAR(paceline::ui::getenv_double("PACELINE_HALF_TRUST_HOURS", 9.0), 9.0, 1e-12);
  ASSERT_NEAR(paceline::ui::getenv_double("PACELINE_UNSET_DOUBLE", 2.5), 2.5, 1e-12);
  ASSERT_EQ(paceline::ui::getenv_int("PACELINE_SEVEN_DAY_WIDTH", 8), 8);
  TomlReader toml;
  std::vector<std::string> warnings;
  Config c = load_config(toml, false, &warnings);
  ASSERT_TRUE(warnings.empty());
  ASSERT_NEAR(c.forecast.relevance_coeff, 1.1, 1e-12);
  ASSERT_NEAR(c.forecast.half_trust_hours, 16.0, 1e-12);
  ASSERT_EQ(c.gauge.seven_day_width, 8);

  setenv("PACELINE_RELEVANCE_COEFF", "-2", 1);
  warnings.clear();
  c = load_config(toml, false, &warnings);
  ASSERT_EQ(warnings.size(), 1u);
  ASSERT_NEAR(c.forecast.relevance_coeff, 1.4, 1e-12);
  clear_env();
}

TEST(truecolor_auto_reads_colorterm) {
  const char* saved = std::getenv("COLORTERM");
  std::string keep = saved ? saved : "";
  setenv("COLORTERM", "truecolor", 1);
  ASSERT_EQ(paceline::ui::truecolor_capable(), true);
  ASSERT_EQ(paceline::ui::resolve_truecolor("auto"), true);
  setenv("COLORTERM", "24BIT", 1);
  ASSERT_EQ(paceline::ui::resolve_truecolor("auto"), true);
  setenv("COLORTERM", "TrueColor", 1);
  ASSERT_EQ(paceline::ui::truecolor_capable(), true);
  setenv("COLORTERM", "xterm-256color", 1);
  ASSERT_EQ(paceline::ui::resolve_truecolor("auto"), false);
  ASSERT_EQ(paceline::ui::resolve_truecolor("on"), true);
  unsetenv("COLORTERM");
  ASSERT_EQ(paceline::ui::resolve_truecolor("auto"), false);
  ASSERT_EQ(paceline::ui::resolve_truecolor("whatever"), false);
  if (saved) setenv("COLORTERM", keep.c_str(), 1);
}
