#include "ui/Chart.hpp"
#include "ui/Errors.hpp"
#include "ui/Text.hpp"
#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace tessera::ui {

Block bar_chart(const model::ChartData& values, std::optional<int> width, bool show_values,
                const RenderConfig& cfg) {
  const int w = cfg.resolve_width(width);
  double max_v = 0.0;
  int label_w = 0;
  int value_w = 0;
  for (const auto& [label, v] : values) {
    if (!(v >= 0.0) || !std::isfinite(v))
      throw InvalidInput("bar_chart: value for \"" + label + "\" must be a non-negative number");
    max_v = std::max(max_v, v);
    label_w = std::max(label_w, display_cols(label));
    value_w = std::max(value_w, display_cols(format_number(v)));
  }
  if (values.empty()) return Block();

  const int suffix_w = show_values ? value_w + 1 : 0;
  const int label_col = label_w > 0 ? label_w + 1 : 0;
  const int bar_w = std::max(0, w - label_col - suffix_w);

  std::vector<std::string> lines;
  lines.reserve(values.size());
  for (const auto& [label, v] : values) {
    double frac = max_v > 0.0 ? v / max_v : 0.0;
    std::string ln;
    if (label_w > 0) ln = align(label, label_w) + " ";
    ln += tessera::util::retro_bar(frac, bar_w, kBarFill, ' ');
    if (show_values) ln += " " + align(format_number(v), value_w, Align::Right);
    lines.push_back(std::move(ln));
  }
  return Block(std::move(lines));
}

Block progress(double value, double total, std::optional<int> width, const std::string& label,
               const RenderConfig& cfg) {
  if (!(total > 0.0) || !std::isfinite(total))
    throw InvalidInput("progress: total must be positive, got " + format_number(total));
  if (!std::isfinite(value))
    throw InvalidInput("progress: value must be a finite number");

  // "[" + cells + "] " + "100%", plus "label " when labelled
  const int decor = 2 + 1 + 4 + (label.empty() ? 0 : display_cols(label) + 1);
  const int cells = width ? cfg.resolve_width(width) : std::max(1, cfg.resolve_width() - decor);

  // value/total can overflow to +inf for tiny totals; clamp before rounding.
  double frac = value / total;
  frac = std::isfinite(frac) ? std::clamp(frac, 0.0, 1.0) : (frac > 0.0 ? 1.0 : 0.0);
  const long pct = std::lround(frac * 100.0);
  std::string ln;
  if (!label.empty()) ln += label + " ";
  ln += "[" + tessera::util::retro_bar(frac, cells, kBarFill, kProgressTrack) + "] ";
  ln += align(std::to_string(pct), 3, Align::Right) + "%";
  return Block(std::vector<std::string>{ln});
}

Block progress(const model::ProgressData& data, std::optional<int> width, const RenderConfig& cfg) {
  return progress(data.value, data.total, width, data.label, cfg);
}

Block sparkline(const model::SeriesData& values, std::optional<int> width, const RenderConfig& cfg) {
  const int cap = cfg.resolve_width(width);
  if (values.empty()) return Block();
  for (double v : values) {
    if (!std::isfinite(v)) throw InvalidInput("sparkline: values must be finite numbers");
  }
  const int n = width ? cap : std::min((int)values.size(), cap);
  const int take = std::min((int)values.size(), n);
  auto first = values.end() - take;
  auto [lo_it, hi_it] = std::minmax_element(first, values.end());
  const double lo = *lo_it, hi = *hi_it;
  const int levels = (int)std::strlen(kSparkRamp);

  std::string ln;
  ln.reserve(n);
  for (auto it = first; it != values.end(); ++it) {
    int idx = levels / 2;
    if (hi > lo) idx = (int)std::lround((*it - lo) / (hi - lo) * (levels - 1));
    ln.push_back(kSparkRamp[std::clamp(idx, 0, levels - 1)]);
  }
  // Fewer samples than the requested width: left-pad so the trend ends flush right.
  if ((int)ln.size() < n) ln.insert(0, (size_t)(n - (int)ln.size()), ' ');
  return Block(std::vector<std::string>{ln});
}

} // namespace tessera::ui
