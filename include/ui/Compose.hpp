#pragma once

#include "ui/Block.hpp"
#include <optional>
#include <vector>

namespace tessera::ui {

// Vertical concatenation. `spacing` blank lines go between neighbours; with a
// separator a rule of the output width sits between them as well.
// Negative spacing raises InvalidInput.
[[nodiscard]] Block stack(const std::vector<Block>& blocks, int spacing = 0,
                          std::optional<char> separator = std::nullopt);

[[nodiscard]] Block compose(const std::vector<Block>& blocks, int spacing = 0);
[[nodiscard]] Block compose(const std::vector<Block>& blocks, int spacing, char separator);

} // namespace tessera::ui
