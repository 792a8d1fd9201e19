#pragma once

#include "model/Data.hpp"
#include "ui/Block.hpp"
#include "ui/Config.hpp"
#include <optional>
#include <string>

namespace tessera::ui {

// Item prefix for a list style: bullet "* ", arrow "-> ", dash "- ",
// check "[x] ", uncheck "[ ] ". Unknown names fall back to bullet.
std::string list_marker(const std::string& style);

// One item per line ("N. " when numbered). Long items wrap with their
// continuation lines indented under the item text.
Block list_display(const model::ListData& items, bool numbered = false,
                   const std::string& style = "bullet",
                   std::optional<int> width = std::nullopt,
                   const RenderConfig& cfg = {});

} // namespace tessera::ui
