#include "app/Segments.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"
#include <algorithm>

namespace paceline::app {

using paceline::model::SessionInfo;
using paceline::model::UsageWindow;
using paceline::ui::ResolvedTheme;
using paceline::ui::Role;
using paceline::ui::sgr_reset;

namespace {

struct SegmentNameDef { const char* name; SegmentKind kind; };
constexpr SegmentNameDef segment_names[] = {
  {"model",     SegmentKind::Model},
  {"dir",       SegmentKind::Directory},
  {"directory", SegmentKind::Directory},
  {"context",   SegmentKind::Context},
  {"five_hour", SegmentKind::FiveHour},
  {"5h",        SegmentKind::FiveHour},
  {"seven_day", SegmentKind::SevenDay},
  {"7d",        SegmentKind::SevenDay},
};

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
  return sv;
}

std::string paint(const ResolvedTheme& theme, Role role, const std::string& text) {
  return theme.fg(role) + text + sgr_reset();
}

std::string render_model(const SessionInfo& s, const ResolvedTheme& theme) {
  if (s.model_name.empty()) return {};
  return theme.pair(Role::BadgeBg, Role::BadgeFg) + " " + s.model_name + " " + sgr_reset();
}

std::string render_dir(const SessionInfo& s, const ResolvedTheme& theme) {
  if (s.dir_name.empty()) return {};
  return paint(theme, Role::Accent, s.dir_name);
}

std::string render_context(const SessionInfo& s, const LineOptions& opt, const ResolvedTheme& theme) {
  if (s.context_limit == 0) return {};
  double pct = static_cast<double>(s.context_tokens) / static_cast<double>(s.context_limit) * 100.0;
  std::string out = paint(theme, Role::Muted, "ctx") + " ";
  if (opt.context_width > 0)
    out += paceline::ui::render_usage_bar(pct, opt.context_width, theme) + " ";
  out += theme.fg(theme.gradient(pct)) + paceline::ui::format_pct(pct) + sgr_reset();
  out += " " + paint(theme, Role::Muted, paceline::ui::format_tokens(s.context_tokens));
  return out;
}

std::string render_window(const std::optional<UsageWindow>& w, int64_t now,
                          paceline::ui::GaugeStyle style, int width,
                          const LineOptions& opt, const ResolvedTheme& theme) {
  if (!w) return {};
  ForecastResult r = evaluate_window(*w, now, opt.forecast);
  std::string out = paint(theme, Role::Muted, w->label) + " ";
  std::string gauge = paceline::ui::render_pace_gauge(style, r.ratio, width, theme, opt.max_gauge_width);
  if (!gauge.empty()) out += gauge + " ";
  out += paint(theme, ResolvedTheme::tier_role(r.tier), paceline::ui::format_pct(w->clamped_utilization()));
  if (opt.show_ratio)
    out += " " + paint(theme, Role::Muted, paceline::ui::format_ratio(r.ratio));
  if (!r.message.empty())
    out += " " + paint(theme, ResolvedTheme::tier_role(r.message_tier), r.message);
  return out;
}

} // namespace

std::optional<SegmentKind> parse_segment_kind(std::string_view name) {
  std::string n = paceline::util::ascii_lower_copy(std::string(trim(name)));
  for (const auto& def : segment_names)
    if (n == def.name) return def.kind;
  return std::nullopt;
}

std::vector<SegmentKind> parse_segments(std::string_view list, std::vector<std::string>* unknown) {
  std::vector<SegmentKind> out;
  while (!list.empty()) {
    auto comma = list.find(',');
    auto item = trim(list.substr(0, comma));
    list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    if (item.empty()) continue;
    auto kind = parse_segment_kind(item);
    if (!kind) {
      if (unknown) unknown->emplace_back(item);
      continue;
    }
    if (std::find(out.begin(), out.end(), *kind) == out.end()) out.push_back(*kind);
  }
  return out;
}

LineOptions line_options(const paceline::ui::Config& cfg, std::vector<std::string>* warnings) {
  LineOptions o;
  std::vector<std::string> unknown;
  o.segments = parse_segments(cfg.line.segments, &unknown);
  if (warnings)
    for (const auto& u : unknown) warnings->push_back("line.segments: unknown segment '" + u + "'");
  o.separator = cfg.line.separator;
  o.max_cols = cfg.line.max_cols;
  o.five_hour_style = cfg.gauge.five_hour_style;
  o.seven_day_style = cfg.gauge.seven_day_style;
  o.five_hour_width = cfg.gauge.five_hour_width;
  o.seven_day_width = cfg.gauge.seven_day_width;
  o.max_gauge_width = cfg.gauge.max_width;
  o.context_width = cfg.gauge.context_width;
  o.show_ratio = cfg.forecast.show_ratio;
  o.forecast.half_trust_seconds = cfg.forecast.half_trust_hours * 3600.0;
  o.forecast.relevance_coeff = cfg.forecast.relevance_coeff;
  return o;
}

std::string render_segment(SegmentKind kind, const SessionInfo& s,
                           const LineOptions& opt, const ResolvedTheme& theme) {
  switch (kind) {
    case SegmentKind::Model:     return render_model(s, theme);
    case SegmentKind::Directory: return render_dir(s, theme);
    case SegmentKind::Context:   return render_context(s, opt, theme);
    case SegmentKind::FiveHour:
      return render_window(s.five_hour, s.now, opt.five_hour_style, opt.five_hour_width, opt, theme);
    case SegmentKind::SevenDay:
      return render_window(s.seven_day, s.now, opt.seven_day_style, opt.seven_day_width, opt, theme);
  }
  return {};
}

std::string compose_line(const SessionInfo& s, const LineOptions& opt, const ResolvedTheme& theme) {
  std::string line;
  const std::string sep = opt.separator.empty() ? std::string() : paint(theme, Role::Separator, opt.separator);
  for (auto kind : opt.segments) {
    std::string seg = render_segment(kind, s, opt, theme);
    if (seg.empty()) continue;
    if (!line.empty()) line += sep;
    line += seg;
  }
  if (opt.max_cols > 0 && paceline::ui::display_cols(line) > opt.max_cols)
    line = paceline::ui::take_cols(line, opt.max_cols);
  return line;
}

} // namespace paceline::app
