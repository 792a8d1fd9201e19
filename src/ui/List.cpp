#include "ui/List.hpp"
#include "ui/Text.hpp"
#include "util/AsciiLower.hpp"
#include <algorithm>
#include <vector>

namespace tessera::ui {

struct MarkerDef { const char* name; const char* marker; };
static constexpr MarkerDef kMarkers[] = {
  {"bullet",  "* "},
  {"arrow",   "-> "},
  {"dash",    "- "},
  {"check",   "[x] "},
  {"uncheck", "[ ] "},
};

std::string list_marker(const std::string& style) {
  std::string s = style;
  for (auto& c : s) c = tessera::util::ascii_lower((unsigned char)c);
  for (const auto& m : kMarkers) {
    if (s == m.name) return m.marker;
  }
  return kMarkers[0].marker;
}

Block list_display(const model::ListData& items, bool numbered, const std::string& style,
                   std::optional<int> width, const RenderConfig& cfg) {
  const int w = cfg.resolve_width(width);
  if (items.empty()) return Block();
  const int digits = (int)std::to_string(items.size()).size();
  const std::string marker = list_marker(style);

  std::vector<std::string> lines;
  for (size_t i = 0; i < items.size(); ++i) {
    std::string prefix = numbered ? align(std::to_string(i + 1), digits, Align::Right) + ". " : marker;
    const int pw = display_cols(prefix);
    // Prefixes wider than the line still get one column of text.
    auto body = wrap(items[i], std::max(1, w - pw));
    for (size_t j = 0; j < body.size(); ++j)
      lines.push_back((j == 0 ? prefix : std::string(pw, ' ')) + body[j]);
  }
  return Block(std::move(lines));
}

} // namespace tessera::ui
