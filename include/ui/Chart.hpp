#pragma once

#include "model/Data.hpp"
#include "ui/Block.hpp"
#include "ui/Config.hpp"
#include <optional>
#include <string>

namespace tessera::ui {

inline constexpr char kBarFill = '#';
inline constexpr char kProgressTrack = '.';
inline constexpr const char* kSparkRamp = "_.-~=+*#";

// Horizontal bars scaled against the largest value:
//   Done     ##########      4
//   Pending  #####           2
// Negative values raise InvalidInput.
Block bar_chart(const model::ChartData& values, std::optional<int> width = std::nullopt,
                bool show_values = false, const RenderConfig& cfg = {});

// "[#####.....]  50%" with an optional leading label. `width` is the number
// of bar cells; without it the bar fills the configured width. Fill and
// percentage are clamped to the bar. total <= 0 raises InvalidInput.
Block progress(double value, double total, std::optional<int> width = std::nullopt,
               const std::string& label = "", const RenderConfig& cfg = {});

Block progress(const model::ProgressData& data, std::optional<int> width = std::nullopt,
               const RenderConfig& cfg = {});

// One-line trend of the last `width` samples using kSparkRamp.
Block sparkline(const model::SeriesData& values, std::optional<int> width = std::nullopt,
                const RenderConfig& cfg = {});

} // namespace tessera::ui
