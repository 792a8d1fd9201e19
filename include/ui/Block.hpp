#pragma once

#include <string>
#include <vector>

namespace tessera::ui {

// Immutable run of text lines that all share one display width.
// Renderers return Blocks; composition builds new Blocks from old ones.
class Block {
public:
  Block() = default;
  // Pads every line to the widest one. Control characters become spaces.
  explicit Block(std::vector<std::string> lines);

  // Splits on '\n'; "" yields one empty line.
  [[nodiscard]] static Block from_text(const std::string& text);

  [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }
  [[nodiscard]] int width() const { return width_; }
  [[nodiscard]] int height() const { return (int)lines_.size(); }
  [[nodiscard]] bool empty() const { return lines_.empty(); }

  // Copy of this block right-padded to at least `width` columns.
  [[nodiscard]] Block widened(int width) const;

  // Lines joined with '\n', no trailing newline.
  [[nodiscard]] std::string to_text() const;

  bool operator==(const Block&) const = default;

private:
  std::vector<std::string> lines_;
  int width_{0};
};

[[nodiscard]] std::string to_text(const Block& b);

} // namespace tessera::ui
