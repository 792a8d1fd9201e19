#pragma once

#include "model/Data.hpp"
#include "ui/Block.hpp"
#include "ui/Config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tessera::ui {

// Column gap between table cells
inline constexpr int kTableGap = 2;

// Header line, one rule line, then the rows. Columns are as wide as their
// widest cell; when the table would exceed the width, columns shrink in
// proportion to their size and cells wrap inside them.
Block table(const std::vector<model::TableRow>& rows,
            const std::vector<std::string>& headers = {},
            std::optional<int> width = std::nullopt,
            const RenderConfig& cfg = {});

Block table(const model::TableData& data,
            std::optional<int> width = std::nullopt,
            const RenderConfig& cfg = {});

// Shrink natural column widths so that columns plus gaps fit `target`.
// Never below 1 per column; returns all-ones when even that does not fit.
std::vector<int> fit_column_widths(const std::vector<int>& natural, int target, int gap = kTableGap);

} // namespace tessera::ui
