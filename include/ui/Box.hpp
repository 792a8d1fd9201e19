#pragma once

#include "ui/Block.hpp"
#include "ui/Config.hpp"
#include <optional>
#include <string>

namespace tessera::ui {

// Frame content in
//   +-- TITLE -----+
//   | content      |
//   +--------------+
// Text is word wrapped to width - 4; Block content keeps its indentation and
// over-wide lines are hard-broken. Titles longer than width - 6 are
// truncated. Non-positive widths raise InvalidConfig; widths 1..4 render the
// narrowest frame (5 columns, one content column) and overflow.
Block box(const std::string& text, const std::string& title = "",
          std::optional<int> width = std::nullopt,
          const RenderConfig& cfg = {}, int min_height = 0);

Block box(const Block& content, const std::string& title = "",
          std::optional<int> width = std::nullopt,
          const RenderConfig& cfg = {}, int min_height = 0);

} // namespace tessera::ui
