#include "ui/Compose.hpp"
#include "ui/Errors.hpp"
#include <algorithm>
#include <string>

namespace tessera::ui {

Block stack(const std::vector<Block>& blocks, int spacing, std::optional<char> separator) {
  if (spacing < 0)
    throw InvalidInput("compose: spacing must not be negative, got " + std::to_string(spacing));
  int w = 0;
  for (const auto& b : blocks) w = std::max(w, b.width());

  std::vector<std::string> lines;
  const std::string blank(w, ' ');
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      for (int s = 0; s < spacing; ++s) lines.push_back(blank);
      if (separator) {
        lines.push_back(std::string(w, *separator));
        for (int s = 0; s < spacing; ++s) lines.push_back(blank);
      }
    }
    const auto& src = blocks[i].lines();
    lines.insert(lines.end(), src.begin(), src.end());
  }
  return Block(std::move(lines));
}

Block compose(const std::vector<Block>& blocks, int spacing) {
  return stack(blocks, spacing);
}

Block compose(const std::vector<Block>& blocks, int spacing, char separator) {
  return stack(blocks, spacing, separator);
}

} // namespace tessera::ui
