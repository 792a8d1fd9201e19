#include "model/Data.hpp"
#include "ui/Text.hpp"

namespace tessera::model {

std::string scalar_text(const Scalar& v) {
  struct Visitor {
    std::string operator()(std::monostate) const { return {}; }
    std::string operator()(bool b) const { return b ? "true" : "false"; }
    std::string operator()(long long n) const { return std::to_string(n); }
    std::string operator()(double d) const { return tessera::ui::format_number(d); }
    std::string operator()(const std::string& s) const { return s; }
  };
  return std::visit(Visitor{}, v);
}

const Scalar* KeyedRow::find(const std::string& key) const {
  for (const auto& [k, v] : cells)
    if (k == key) return &v;
  return nullptr;
}

TreeValue TreeValue::leaf(std::string text) {
  TreeValue t;
  t.kind_ = Kind::Leaf;
  t.text_ = std::move(text);
  return t;
}

TreeValue TreeValue::list(std::vector<TreeValue> items) {
  TreeValue t;
  t.kind_ = Kind::List;
  t.items_ = std::move(items);
  return t;
}

TreeValue TreeValue::node(std::vector<std::pair<std::string, TreeValue>> children) {
  TreeValue t;
  t.kind_ = Kind::Node;
  t.children_ = std::move(children);
  return t;
}

TreeValue& TreeValue::push(TreeValue item) {
  items_.push_back(std::move(item));
  return *this;
}

TreeValue& TreeValue::add(std::string label, TreeValue child) {
  children_.emplace_back(std::move(label), std::move(child));
  return *this;
}

} // namespace tessera::model
