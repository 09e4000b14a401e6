#pragma once

#include "app/Forecast.hpp"
#include "model/Usage.hpp"
#include "ui/Config.hpp"
#include "ui/Gauge.hpp"
#include "ui/Theme.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paceline::app {

enum class SegmentKind { Model, Directory, Context, FiveHour, SevenDay };

[[nodiscard]] std::optional<SegmentKind> parse_segment_kind(std::string_view name);

// Comma-separated list in display order; unknown names land in `unknown`,
// repeats are dropped.
[[nodiscard]] std::vector<SegmentKind> parse_segments(std::string_view list,
                                                      std::vector<std::string>* unknown = nullptr);

struct LineOptions {
  std::vector<SegmentKind> segments;
  std::string separator{" │ "};
  int max_cols{0};
  paceline::ui::GaugeStyle five_hour_style{paceline::ui::GaugeStyle::Blocks};
  paceline::ui::GaugeStyle seven_day_style{paceline::ui::GaugeStyle::Vertical};
  int five_hour_width{8};
  int seven_day_width{8};
  int max_gauge_width{paceline::ui::kDefaultMaxGaugeWidth};
  int context_width{10};
  bool show_ratio{false};
  ForecastParams forecast;
};

[[nodiscard]] LineOptions line_options(const paceline::ui::Config& cfg,
                                       std::vector<std::string>* warnings = nullptr);

// Empty string when the segment has nothing to show.
[[nodiscard]] std::string render_segment(SegmentKind kind, const paceline::model::SessionInfo& s,
                                         const LineOptions& opt, const paceline::ui::ResolvedTheme& theme);

[[nodiscard]] std::string compose_line(const paceline::model::SessionInfo& s, const LineOptions& opt,
                                       const paceline::ui::ResolvedTheme& theme);

} // namespace paceline::app
