#include "minitest.hpp"
#include "ui/Errors.hpp"
#include "ui/Text.hpp"
#include "ui/Tree.hpp"
#include <string>

using namespace tessera;
using namespace tessera::ui;
using model::TreeValue;

static bool uniform(const Block& b) {
  for (const auto& ln : b.lines())
    if (display_cols(ln) != b.width()) return false;
  return true;
}

static std::string rstrip(std::string s) {
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

TEST(tree_lists_and_nested_mappings) {
  auto data = TreeValue::node();
  data.add("X", TreeValue::list({TreeValue::leaf("a"), TreeValue::leaf("b")}));
  data.add("Y", TreeValue::node({{"Z", TreeValue::leaf("c")}}));
  auto t = tree(data);
  ASSERT_EQ(t.height(), 5);
  ASSERT_TRUE(uniform(t));
  ASSERT_EQ(rstrip(t.lines()[0]), "+-- X");
  ASSERT_EQ(rstrip(t.lines()[1]), "|   +-- a");
  ASSERT_EQ(rstrip(t.lines()[2]), "|   +-- b");
  ASSERT_EQ(rstrip(t.lines()[3]), "+-- Y");
  ASSERT_EQ(rstrip(t.lines()[4]), "    +-- Z: c");
}

TEST(tree_scalar_leaves_inline) {
  auto data = TreeValue::node({{"cpu", TreeValue::leaf("8 cores")}, {"mem", TreeValue::leaf("16G")}});
  auto t = tree(data);
  ASSERT_EQ(t.height(), 2);
  ASSERT_EQ(rstrip(t.lines()[0]), "+-- cpu: 8 cores");
  ASSERT_EQ(rstrip(t.lines()[1]), "+-- mem: 16G");
}

TEST(tree_deep_nesting_keeps_open_ancestors) {
  auto leafy = TreeValue::node({{"d", TreeValue::leaf("1")}});
  auto mid = TreeValue::node({{"c", leafy}, {"e", TreeValue::leaf("2")}});
  auto data = TreeValue::node({{"a", TreeValue::node({{"b", mid}})}, {"z", TreeValue::leaf("3")}});
  auto t = tree(data);
  ASSERT_EQ(rstrip(t.lines()[0]), "+-- a");
  ASSERT_EQ(rstrip(t.lines()[1]), "|   +-- b");
  ASSERT_EQ(rstrip(t.lines()[2]), "|       +-- c");
  ASSERT_EQ(rstrip(t.lines()[3]), "|       |   +-- d: 1");
  ASSERT_EQ(rstrip(t.lines()[4]), "|       +-- e: 2");
  ASSERT_EQ(rstrip(t.lines()[5]), "+-- z: 3");
}

TEST(tree_non_leaf_list_items_get_an_index) {
  auto item = TreeValue::node({{"k", TreeValue::leaf("v")}});
  auto data = TreeValue::node({{"L", TreeValue::list({item})}});
  auto t = tree(data);
  ASSERT_EQ(rstrip(t.lines()[1]), "    +-- [0]");
  ASSERT_EQ(rstrip(t.lines()[2]), "        +-- k: v");
}

TEST(tree_empty_children_render_key_only) {
  auto data = TreeValue::node({{"none", TreeValue::list()}, {"blank", TreeValue::node()}});
  auto t = tree(data);
  ASSERT_EQ(t.height(), 2);
  ASSERT_EQ(rstrip(t.lines()[1]), "+-- blank");
}

TEST(tree_empty_root_is_empty_block) {
  ASSERT_TRUE(tree(TreeValue::node()).empty());
}

TEST(tree_root_must_be_mapping) {
  ASSERT_THROWS(tree(TreeValue::leaf("x")), InvalidInput);
  ASSERT_THROWS(tree(TreeValue::list()), InvalidInput);
}
