#pragma once

#include "model/Usage.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace paceline::app {

struct ForecastParams {
  double half_trust_seconds = 16.0 * 3600.0;  // observed/expected blend is 50/50 here
  double relevance_coeff = 1.4;
};

enum class ForecastMode {
  Soon,       // depletion under an hour: point at the reset instead
  Countdown,  // 1h..48h: time of usage left, then the wait
  Pace,       // 48h and beyond: only how much sooner than scheduled
};

[[nodiscard]] const char* forecast_mode_name(ForecastMode m);

struct Depletion {
  double seconds_to_depletion{};
  double seconds_until_reset{};
  double seconds_early{};
  ForecastMode mode{ForecastMode::Pace};
};

struct ForecastResult {
  double ratio{1.0};
  paceline::model::Tier tier{paceline::model::Tier::OnTrack};
  std::optional<Depletion> depletion;
  std::string message;                                  // empty when no forecast
  paceline::model::Tier message_tier{paceline::model::Tier::OnTrack};
};

// Remaining-budget fraction over remaining-time fraction. 1.0 is exactly on pace.
[[nodiscard]] double pace_ratio(double elapsed_seconds, double window_seconds, double utilization_pct);

[[nodiscard]] bool passes_relevance(double seconds_early, double seconds_until_reset, double coeff);

[[nodiscard]] ForecastMode select_mode(double seconds_to_depletion);

// Blended-rate depletion forecast; nullopt when not trending to run out
// early or when the margin is too small to be worth surfacing.
[[nodiscard]] std::optional<Depletion> forecast_depletion(double elapsed_seconds,
                                                          double window_seconds,
                                                          double utilization_pct,
                                                          double seconds_until_reset,
                                                          const ForecastParams& params = {});

// "" under 30 minutes, then "45m", "7h", "1.5 d".
[[nodiscard]] std::string format_duration(double seconds);

[[nodiscard]] std::string forecast_message(const Depletion& d);
[[nodiscard]] paceline::model::Tier forecast_tier(ForecastMode m);

// Everything the status line needs for one window at `now`.
[[nodiscard]] ForecastResult evaluate_window(const paceline::model::UsageWindow& w, int64_t now,
                                             const ForecastParams& params = {});

} // namespace paceline::app
