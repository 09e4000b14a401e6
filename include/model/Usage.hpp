#pragma once
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace paceline::model {

// One rolling usage budget. Built fresh per render from fetched numbers.
struct UsageWindow {
  std::string label;            // e.g. "5h", "7d"
  int64_t window_seconds{};     // length of the rolling window
  double  utilization_pct{};    // consumed so far, 0..100 (may overshoot)
  int64_t reset_at{};           // epoch seconds when utilization returns to 0

  double clamped_utilization() const { return std::clamp(utilization_pct, 0.0, 100.0); }
  // Double arithmetic: no overflow for any int64 epoch.
  double elapsed_seconds(int64_t now) const {
    return static_cast<double>(now) - (static_cast<double>(reset_at) - static_cast<double>(window_seconds));
  }
  double seconds_until_reset(int64_t now) const {
    return static_cast<double>(reset_at) - static_cast<double>(now);
  }
};

inline constexpr int64_t kFiveHourSeconds = 5 * 3600;
inline constexpr int64_t kSevenDaySeconds = 7 * 86400;

inline UsageWindow five_hour_window(double pct, int64_t reset_at) {
  return UsageWindow{"5h", kFiveHourSeconds, pct, reset_at};
}

inline UsageWindow seven_day_window(double pct, int64_t reset_at) {
  return UsageWindow{"7d", kSevenDaySeconds, pct, reset_at};
}

// Pace bands shared by gauge colouring and text colouring.
enum class Tier { Ahead, OnTrack, Caution, Critical };

inline constexpr double kCautionFloor = 0.75;
inline constexpr double kAheadFloor = 1.0 / kCautionFloor;  // ~1.333

inline Tier classify_tier(double ratio) {
  if (ratio >= kAheadFloor) return Tier::Ahead;
  if (ratio >= 1.0) return Tier::OnTrack;
  if (ratio >= kCautionFloor) return Tier::Caution;
  return Tier::Critical;
}

inline const char* tier_name(Tier t) {
  switch (t) {
    case Tier::Ahead:    return "ahead";
    case Tier::OnTrack:  return "on-track";
    case Tier::Caution:  return "caution";
    case Tier::Critical: return "critical";
  }
  return "critical";
}

struct SessionInfo {
  std::string model_name;        // display name of the assistant model
  std::string dir_name;          // basename of the working directory
  uint64_t context_tokens{};     // tokens currently in the context window
  uint64_t context_limit{};      // 0 => context segment hidden
  std::optional<UsageWindow> five_hour;
  std::optional<UsageWindow> seven_day;
  int64_t now{};                 // single "now" shared by every window in a pass
};

} // namespace paceline::model
