#include "ui/Tree.hpp"
#include "ui/Errors.hpp"
#include <string>
#include <vector>

namespace tessera::ui {

using model::TreeValue;

static constexpr const char* kGuide = "+-- ";
static constexpr const char* kPipe = "|   ";
static constexpr const char* kSpace = "    ";

static void render_value(const TreeValue& v, const std::string& prefix, std::vector<std::string>& out);

// One guided line for `label`, then whatever hangs below it.
static void render_entry(const std::string& label, const TreeValue& v, const std::string& prefix,
                         bool last, std::vector<std::string>& out) {
  if (v.is_leaf()) {
    out.push_back(prefix + kGuide + label + ": " + v.text());
    return;
  }
  out.push_back(prefix + kGuide + label);
  render_value(v, prefix + (last ? kSpace : kPipe), out);
}

static void render_value(const TreeValue& v, const std::string& prefix, std::vector<std::string>& out) {
  if (v.is_node()) {
    const auto& kids = v.children();
    for (size_t i = 0; i < kids.size(); ++i)
      render_entry(kids[i].first, kids[i].second, prefix, i + 1 == kids.size(), out);
    return;
  }
  if (v.is_list()) {
    const auto& items = v.items();
    for (size_t i = 0; i < items.size(); ++i) {
      const bool last = i + 1 == items.size();
      if (items[i].is_leaf()) {
        out.push_back(prefix + kGuide + items[i].text());
      } else {
        out.push_back(prefix + kGuide + "[" + std::to_string(i) + "]");
        render_value(items[i], prefix + (last ? kSpace : kPipe), out);
      }
    }
  }
}

Block tree(const TreeValue& data) {
  if (!data.is_node()) throw InvalidInput("tree: root must be a mapping");
  std::vector<std::string> lines;
  render_value(data, std::string(), lines);
  return Block(std::move(lines));
}

} // namespace tessera::ui
