#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::model {

// A single table cell. monostate renders as an empty cell.
using Scalar = std::variant<std::monostate, bool, long long, double, std::string>;

std::string scalar_text(const Scalar& v);

// Cells aligned to the header order.
struct PositionalRow {
  std::vector<Scalar> cells;
};

// Cells looked up by exact header name; key order is kept for header inference.
struct KeyedRow {
  std::vector<std::pair<std::string, Scalar>> cells;
  [[nodiscard]] const Scalar* find(const std::string& key) const;
};

using TableRow = std::variant<PositionalRow, KeyedRow>;

struct TableData {
  std::vector<std::string> headers;  // empty: infer from the first keyed row
  std::vector<TableRow> rows;
};

// Leaf(string) | List(TreeValue...) | Node(label -> TreeValue, ordered)
class TreeValue {
public:
  enum class Kind { Leaf, List, Node };

  TreeValue() : kind_(Kind::Node) {}

  [[nodiscard]] static TreeValue leaf(std::string text);
  [[nodiscard]] static TreeValue list(std::vector<TreeValue> items = {});
  [[nodiscard]] static TreeValue node(std::vector<std::pair<std::string, TreeValue>> children = {});

  [[nodiscard]] Kind kind() const { return kind_; }
  [[nodiscard]] bool is_leaf() const { return kind_ == Kind::Leaf; }
  [[nodiscard]] bool is_list() const { return kind_ == Kind::List; }
  [[nodiscard]] bool is_node() const { return kind_ == Kind::Node; }

  [[nodiscard]] const std::string& text() const { return text_; }
  [[nodiscard]] const std::vector<TreeValue>& items() const { return items_; }
  [[nodiscard]] const std::vector<std::pair<std::string, TreeValue>>& children() const { return children_; }

  // Builders; list items only apply to List, children only to Node.
  TreeValue& push(TreeValue item);
  TreeValue& add(std::string label, TreeValue child);

private:
  Kind kind_;
  std::string text_;
  std::vector<TreeValue> items_;
  std::vector<std::pair<std::string, TreeValue>> children_;
};

// Ordered (label, value) series; values must be non-negative.
using ChartData = std::vector<std::pair<std::string, double>>;

struct ProgressData {
  double value{0.0};
  double total{0.0};
  std::string label;
};

using ListData = std::vector<std::string>;
using SeriesData = std::vector<double>;

} // namespace tessera::model
