#include "ui/Block.hpp"
#include "ui/Text.hpp"
#include <algorithm>

namespace tessera::ui {

Block::Block(std::vector<std::string> lines) : lines_(std::move(lines)) {
  for (auto& ln : lines_) {
    ln = sanitize(ln);
    width_ = std::max(width_, display_cols(ln));
  }
  for (auto& ln : lines_) {
    int cols = display_cols(ln);
    if (cols < width_) ln.append(width_ - cols, ' ');
  }
}

Block Block::from_text(const std::string& text) {
  return Block(split_lines(text));
}

Block Block::widened(int width) const {
  if (width <= width_) return *this;
  Block out;
  out.width_ = width;
  out.lines_.reserve(lines_.size());
  for (const auto& ln : lines_) out.lines_.push_back(ln + std::string(width - width_, ' '));
  return out;
}

std::string Block::to_text() const {
  std::string out;
  size_t total = 0;
  for (const auto& ln : lines_) total += ln.size() + 1;
  out.reserve(total);
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i) out += '\n';
    out += lines_[i];
  }
  return out;
}

std::string to_text(const Block& b) { return b.to_text(); }

} // namespace tessera::ui
