#include "ui/Box.hpp"
#include "ui/Text.hpp"
#include <algorithm>
#include <vector>

namespace tessera::ui {

// Narrowest frame that still has one content column.
static constexpr int kMinBoxWidth = 5;

// Positive widths below the minimum degrade to the minimum frame, which then
// overflows the requested width the way an over-wide table does.
static int box_width(std::optional<int> width, const RenderConfig& cfg) {
  return std::max(cfg.resolve_width(width), kMinBoxWidth);
}

static Block make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = width - 4;
  std::vector<std::string> out;
  out.reserve(lines.size() + 2);
  if (!title.empty()) {
    // "+-- " + title + " " + dashes + "+"
    int room = width - 6;
    std::string t = room > 0 ? title : std::string();
    if (display_cols(t) > room) t = trunc_pad(t, room);
    if (t.empty()) {
      out.push_back("+" + std::string(width - 2, '-') + "+");
    } else {
      int fill = width - 6 - display_cols(t);
      out.push_back("+-- " + t + " " + std::string(fill, '-') + "+");
    }
  } else {
    out.push_back("+" + std::string(width - 2, '-') + "+");
  }
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    const std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back("| " + align(ln, iw) + " |");
  }
  out.push_back("+" + std::string(width - 2, '-') + "+");
  return Block(std::move(out));
}

Block box(const std::string& text, const std::string& title, std::optional<int> width,
          const RenderConfig& cfg, int min_height) {
  int w = box_width(width, cfg);
  return make_box(title, wrap(text, w - 4), w, min_height);
}

Block box(const Block& content, const std::string& title, std::optional<int> width,
          const RenderConfig& cfg, int min_height) {
  int w = box_width(width, cfg);
  std::vector<std::string> lines;
  lines.reserve(content.lines().size());
  for (const auto& ln : content.lines()) {
    // Trailing padding belongs to the block, not the content.
    std::string trimmed = ln;
    while (!trimmed.empty() && trimmed.back() == ' ') trimmed.pop_back();
    auto pieces = hard_break(trimmed, w - 4);
    lines.insert(lines.end(), pieces.begin(), pieces.end());
  }
  return make_box(title, lines, w, min_height);
}

} // namespace tessera::ui
