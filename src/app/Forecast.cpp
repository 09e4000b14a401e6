#include "app/Forecast.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace paceline::app {

using paceline::model::Tier;

namespace {

constexpr double kHour = 3600.0;
constexpr double kDay = 86400.0;
constexpr double kMinSurfaced = 30.0 * 60.0;
constexpr double kSoonBelow = kHour;
constexpr double kPaceFrom = 48.0 * kHour;
// Below this much remaining time the ratio is no longer meaningful.
constexpr double kRemainingTimeEpsilonPct = 0.1;

std::string trim_trailing_zero(std::string s) {
  if (s.size() >= 2 && s.compare(s.size() - 2, 2, ".0") == 0) s.resize(s.size() - 2);
  return s;
}

} // namespace

const char* forecast_mode_name(ForecastMode m) {
  switch (m) {
    case ForecastMode::Soon:      return "soon";
    case ForecastMode::Countdown: return "countdown";
    case ForecastMode::Pace:      return "pace";
  }
  return "pace";
}

double pace_ratio(double elapsed_seconds, double window_seconds, double utilization_pct) {
  const double util = std::clamp(utilization_pct, 0.0, 100.0);
  const double remaining_budget = 100.0 - util;
  // A zero-length window is treated as fully elapsed.
  const double elapsed_pct = window_seconds > 0.0
      ? std::clamp(elapsed_seconds / window_seconds * 100.0, 0.0, 100.0)
      : 100.0;
  const double remaining_time = 100.0 - elapsed_pct;
  if (remaining_time > kRemainingTimeEpsilonPct) return remaining_budget / remaining_time;
  // Window is over: anything left is maximally ahead; both ending together is on pace.
  return remaining_budget > 0.0 ? 2.0 : 1.0;
}

bool passes_relevance(double seconds_early, double seconds_until_reset, double coeff) {
  const double days = std::max(0.0, seconds_until_reset / kDay);
  return seconds_early >= std::pow(days, coeff) * kHour;
}

ForecastMode select_mode(double seconds_to_depletion) {
  if (seconds_to_depletion < kSoonBelow) return ForecastMode::Soon;
  if (seconds_to_depletion >= kPaceFrom) return ForecastMode::Pace;
  return ForecastMode::Countdown;
}

std::optional<Depletion> forecast_depletion(double elapsed_seconds, double window_seconds,
                                            double utilization_pct, double seconds_until_reset,
                                            const ForecastParams& params) {
  const double util = std::clamp(utilization_pct, 0.0, 100.0);
  if (!(elapsed_seconds > 0.0) || !(util > 0.0) || !(window_seconds > 0.0)) return std::nullopt;
  if (!(pace_ratio(elapsed_seconds, window_seconds, util) < 1.0)) return std::nullopt;

  const double observed_rate = util / elapsed_seconds;
  const double on_track_rate = 100.0 / window_seconds;
  // Hyperbolic trust: the measured rate earns weight as the window fills.
  const double k = std::max(0.0, params.half_trust_seconds);
  const double f = elapsed_seconds / (k + elapsed_seconds);
  const double effective_rate = observed_rate * f + on_track_rate * (1.0 - f);
  if (!(effective_rate > on_track_rate)) return std::nullopt;

  Depletion d;
  d.seconds_to_depletion = (100.0 - util) / effective_rate;
  d.seconds_until_reset = seconds_until_reset;
  d.seconds_early = seconds_until_reset - d.seconds_to_depletion;
  if (!(d.seconds_early > 0.0)) return std::nullopt;
  if (!passes_relevance(d.seconds_early, seconds_until_reset, params.relevance_coeff)) return std::nullopt;
  d.mode = select_mode(d.seconds_to_depletion);
  return d;
}

std::string format_duration(double seconds) {
  if (!(seconds >= kMinSurfaced) || !std::isfinite(seconds)) return {};
  if (seconds < kHour) {
    long m = std::lround(seconds / 60.0);
    if (m >= 60) return "1h";
    return std::to_string(m) + "m";
  }
  if (seconds < kDay) {
    long h = std::lround(seconds / kHour);
    if (h < 24) return std::to_string(h) + "h";
  }
  const double days = std::round(seconds / kDay * 10.0) / 10.0;
  int n = std::snprintf(nullptr, 0, "%.1f", days);
  if (n <= 0) return {};
  std::string buf(static_cast<size_t>(n), '\0');
  std::snprintf(buf.data(), buf.size() + 1, "%.1f", days);
  return trim_trailing_zero(std::move(buf)) + " d";
}

std::string forecast_message(const Depletion& d) {
  switch (d.mode) {
    case ForecastMode::Soon: {
      auto reset = format_duration(d.seconds_until_reset);
      if (reset.empty()) return "nearly out, resets soon";
      return "nearly out, resets in " + reset;
    }
    case ForecastMode::Countdown: {
      std::string msg = format_duration(d.seconds_to_depletion) + " left";
      if (d.seconds_early > kHour) {
        auto wait = format_duration(d.seconds_early);
        if (!wait.empty()) msg += ", then " + wait + " wait";
      }
      return msg;
    }
    case ForecastMode::Pace: {
      auto early = format_duration(d.seconds_early);
      if (early.empty()) return "runs out early";
      return "runs out " + early + " early";
    }
  }
  return {};
}

Tier forecast_tier(ForecastMode m) {
  switch (m) {
    case ForecastMode::Soon:
    case ForecastMode::Countdown: return Tier::Critical;
    case ForecastMode::Pace:      return Tier::Caution;
  }
  return Tier::Caution;
}

ForecastResult evaluate_window(const paceline::model::UsageWindow& w, int64_t now,
                               const ForecastParams& params) {
  ForecastResult r;
  const double elapsed = w.elapsed_seconds(now);
  const double window = static_cast<double>(w.window_seconds);
  const double util = w.clamped_utilization();
  r.ratio = pace_ratio(elapsed, window, util);
  r.tier = paceline::model::classify_tier(r.ratio);
  r.depletion = forecast_depletion(elapsed, window, util,
                                   w.seconds_until_reset(now), params);
  if (r.depletion) {
    r.message = forecast_message(*r.depletion);
    r.message_tier = forecast_tier(r.depletion->mode);
  }
  return r;
}

} // namespace paceline::app
