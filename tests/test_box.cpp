#include "minitest.hpp"
#include "ui/Box.hpp"
#include "ui/Errors.hpp"
#include "ui/Text.hpp"
#include <string>

using namespace tessera::ui;

static bool uniform(const Block& b) {
  for (const auto& ln : b.lines())
    if (display_cols(ln) != b.width()) return false;
  return true;
}

TEST(box_titled_three_lines) {
  auto b = box("hi", "T", 10);
  ASSERT_EQ(b.height(), 3);
  ASSERT_EQ(b.width(), 10);
  ASSERT_TRUE(uniform(b));
  ASSERT_EQ(b.lines()[0], "+-- T ---+");
  ASSERT_EQ(b.lines()[1], "| hi     |");
  ASSERT_EQ(b.lines()[2], "+--------+");
}

TEST(box_without_title) {
  auto b = box("x", "", 6);
  ASSERT_EQ(b.lines()[0], "+----+");
  ASSERT_EQ(b.lines()[1], "| x  |");
}

TEST(box_wraps_text_to_inner_width) {
  auto b = box("alpha beta gamma", "", 12);
  ASSERT_EQ(b.width(), 12);
  ASSERT_EQ(b.height(), 2 + 3);
  ASSERT_EQ(b.lines()[1], "| alpha    |");
  ASSERT_EQ(b.lines()[2], "| beta     |");
  ASSERT_EQ(b.lines()[3], "| gamma    |");
  ASSERT_TRUE(uniform(b));
}

TEST(box_uses_config_width) {
  RenderConfig cfg;
  cfg.width = 20;
  auto b = box("hello", "Title", std::nullopt, cfg);
  ASSERT_EQ(b.width(), 20);
  ASSERT_EQ(b.lines()[0], "+-- Title ---------+");
  auto o = box("hello", "", 8, cfg);
  ASSERT_EQ(o.width(), 8);
}

TEST(box_truncates_long_title) {
  auto b = box("x", "A very long title", 12);
  ASSERT_EQ(b.width(), 12);
  ASSERT_EQ(b.lines()[0], "+-- A ver. +");
  ASSERT_TRUE(uniform(b));
}

TEST(box_keeps_block_indentation) {
  auto inner = Block::from_text("root\n    child");
  auto b = box(inner, "", 16);
  ASSERT_EQ(b.lines()[2], "|     child    |");
  ASSERT_TRUE(uniform(b));
}

TEST(box_hard_breaks_wide_block_lines) {
  auto inner = Block::from_text("0123456789");
  auto b = box(inner, "", 8);
  ASSERT_EQ(b.height(), 2 + 3);
  ASSERT_EQ(b.lines()[1], "| 0123 |");
  ASSERT_EQ(b.lines()[3], "| 89   |");
}

TEST(box_min_height_pads) {
  auto b = box("x", "", 6, RenderConfig{}, 3);
  ASSERT_EQ(b.height(), 5);
  ASSERT_EQ(b.lines()[3], "|    |");
}

TEST(box_empty_text_has_one_blank_line) {
  auto b = box("", "", 6);
  ASSERT_EQ(b.height(), 3);
  ASSERT_EQ(b.lines()[1], "|    |");
}

TEST(box_rejects_bad_width) {
  ASSERT_THROWS(box("x", "", 0), InvalidConfig);
  ASSERT_THROWS(box("x", "", -1), InvalidConfig);
}

TEST(box_narrow_width_degrades_to_minimum_frame) {
  auto b = box("hi", "T", 4);
  ASSERT_EQ(b.width(), 5);
  ASSERT_TRUE(uniform(b));
  ASSERT_EQ(b.height(), 4);
  ASSERT_EQ(b.lines()[0], "+---+");
  ASSERT_EQ(b.lines()[1], "| h |");
  ASSERT_EQ(b.lines()[2], "| i |");
  ASSERT_EQ(b.lines()[3], "+---+");
  ASSERT_EQ(box(Block::from_text("ab"), "", 1).height(), 4);
}
