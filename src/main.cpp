#include "app/Forecast.hpp"
#include "app/Segments.hpp"
#include "model/Usage.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/Theme.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using paceline::model::SessionInfo;
using paceline::model::UsageWindow;

// "PCT@RESET_EPOCH", e.g. "42@1760000000"
static bool parse_window_arg(const std::string& v, double& pct, int64_t& reset_at) {
  auto at = v.find('@');
  if (at == std::string::npos) return false;
  try {
    size_t used = 0;
    pct = std::stod(v.substr(0, at), &used);
    if (used != at) return false;
    std::string rs = v.substr(at + 1);
    reset_at = std::stoll(rs, &used);
    return used == rs.size();
  } catch (const std::exception&) {
    return false;
  }
}

static bool parse_u64(const std::string& v, uint64_t& out) {
  try {
    size_t used = 0;
    long long n = std::stoll(v, &used);
    if (used != v.size() || n < 0) return false;
    out = static_cast<uint64_t>(n);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static void debug_window(const char* name, const std::optional<UsageWindow>& w, int64_t now,
                         const paceline::app::ForecastParams& params) {
  if (!w) return;
  auto r = paceline::app::evaluate_window(*w, now, params);
  if (r.depletion) {
    std::fprintf(stderr, "paceline: %s util=%.1f ratio=%.3f tier=%s depletion=%.0fs early=%.0fs mode=%s\n",
                 name, w->clamped_utilization(), r.ratio, paceline::model::tier_name(r.tier),
                 r.depletion->seconds_to_depletion, r.depletion->seconds_early,
                 paceline::app::forecast_mode_name(r.depletion->mode));
  } else {
    std::fprintf(stderr, "paceline: %s util=%.1f ratio=%.3f tier=%s no forecast\n",
                 name, w->clamped_utilization(), r.ratio, paceline::model::tier_name(r.tier));
  }
}

static void usage() {
  std::cout << "Usage: paceline [--model NAME] [--dir NAME] [--context-tokens N --context-limit N]\n"
               "                [--five-hour PCT@RESET] [--seven-day PCT@RESET] [--now EPOCH]\n"
               "                [--theme NAME] [--list-themes]\n"
               "Notes: RESET and EPOCH are seconds since the Unix epoch.\n";
}

int main(int argc, char** argv) {
  SessionInfo s;
  s.now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  std::string theme_override;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) return std::string(argv[++i]);
      return std::nullopt;
    };
    auto bad = [&](const std::string& v) {
      std::fprintf(stderr, "paceline: bad value for %s: '%s'\n", a.c_str(), v.c_str());
      return 2;
    };
    if (a == "-h" || a == "--help") { usage(); return 0; }
    if (a == "--list-themes") {
      for (const auto& n : paceline::ui::theme_names()) std::cout << n << "\n";
      return 0;
    }
    auto v = next();
    if (!v) {
      std::fprintf(stderr, "paceline: unknown or incomplete option '%s'\n", a.c_str());
      usage();
      return 2;
    }
    if (a == "--model") s.model_name = *v;
    else if (a == "--dir") s.dir_name = *v;
    else if (a == "--theme") theme_override = *v;
    else if (a == "--context-tokens") { if (!parse_u64(*v, s.context_tokens)) return bad(*v); }
    else if (a == "--context-limit") { if (!parse_u64(*v, s.context_limit)) return bad(*v); }
    else if (a == "--now") {
      uint64_t n = 0;
      if (!parse_u64(*v, n)) return bad(*v);
      s.now = static_cast<int64_t>(n);
    }
    else if (a == "--five-hour" || a == "--seven-day") {
      double pct = 0.0; int64_t reset_at = 0;
      if (!parse_window_arg(*v, pct, reset_at)) return bad(*v);
      if (a == "--five-hour") s.five_hour = paceline::model::five_hour_window(pct, reset_at);
      else s.seven_day = paceline::model::seven_day_window(pct, reset_at);
    }
    else {
      std::fprintf(stderr, "paceline: unknown option '%s'\n", a.c_str());
      usage();
      return 2;
    }
  }

  const auto& cfg = paceline::ui::config();
  std::vector<std::string> warnings;
  auto opts = paceline::app::line_options(cfg, &warnings);
  auto theme = paceline::ui::resolve_theme(theme_override.empty() ? cfg.theme.name : theme_override,
                                           cfg.theme.overrides,
                                           paceline::ui::resolve_truecolor(cfg.theme.truecolor),
                                           &warnings);
  for (const auto& w : warnings) std::fprintf(stderr, "paceline: %s\n", w.c_str());

  if (cfg.debug) {
    std::fprintf(stderr, "paceline: theme=%s truecolor=%d now=%lld\n",
                 theme.name().c_str(), theme.truecolor() ? 1 : 0, static_cast<long long>(s.now));
    debug_window("5h", s.five_hour, s.now, opts.forecast);
    debug_window("7d", s.seven_day, s.now, opts.forecast);
  }

  std::string line = paceline::app::compose_line(s, opts, theme);
  line += "\n";
  paceline::ui::best_effort_write(STDOUT_FILENO, line.data(), line.size());
  return 0;
}
