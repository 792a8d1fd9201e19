#include "minitest.hpp"
#include "ui/Errors.hpp"
#include "ui/Table.hpp"
#include "ui/Text.hpp"
#include <numeric>
#include <string>
#include <vector>

using namespace tessera;
using namespace tessera::ui;
using model::KeyedRow;
using model::PositionalRow;
using model::Scalar;
using model::TableRow;

static Scalar S(const char* s) { return Scalar(std::string(s)); }
static Scalar N(long long n) { return Scalar(n); }

static bool uniform(const Block& b) {
  for (const auto& ln : b.lines())
    if (display_cols(ln) != b.width()) return false;
  return true;
}

static std::vector<TableRow> ab_rows() {
  std::vector<TableRow> rows;
  rows.push_back(KeyedRow{{{"A", N(1)}, {"B", N(2)}}});
  rows.push_back(KeyedRow{{{"A", N(30)}, {"B", N(4)}}});
  return rows;
}

TEST(table_keyed_rows_layout) {
  auto t = table(ab_rows(), {"A", "B"});
  ASSERT_EQ(t.height(), 4);
  ASSERT_EQ(t.lines()[0], "A   B");
  ASSERT_EQ(t.lines()[1], "-----");
  ASSERT_EQ(t.lines()[2], "1   2");
  ASSERT_EQ(t.lines()[3], "30  4");
  ASSERT_TRUE(uniform(t));
}

TEST(table_header_and_rule_once) {
  auto t = table(ab_rows(), {"A", "B"});
  int headers = 0, rules = 0;
  for (size_t i = 0; i < t.lines().size(); ++i) {
    if (t.lines()[i].rfind("A", 0) == 0 && t.lines()[i].find('B') != std::string::npos) ++headers;
    if (t.lines()[i] == std::string(t.width(), '-')) {
      ++rules;
      ASSERT_EQ(i, 1u);
    }
  }
  ASSERT_EQ(headers, 1);
  ASSERT_EQ(rules, 1);
  // Column "A" is at least as wide as "30"
  ASSERT_TRUE(t.lines()[3].substr(0, 2) == "30");
}

TEST(table_positional_rows) {
  std::vector<TableRow> rows;
  rows.push_back(PositionalRow{{S("alice"), N(30)}});
  rows.push_back(PositionalRow{{S("bob")}});
  auto t = table(rows, {"name", "age"});
  ASSERT_EQ(t.lines()[0], "name   age");
  ASSERT_EQ(t.lines()[2], "alice  30 ");
  ASSERT_EQ(t.lines()[3], "bob       ");
}

TEST(table_missing_key_is_empty_cell) {
  std::vector<TableRow> rows;
  rows.push_back(KeyedRow{{{"id", N(1)}}});
  auto t = table(rows, {"id", "note"});
  ASSERT_EQ(t.lines()[2], "1       ");
}

TEST(table_key_lookup_is_case_sensitive) {
  std::vector<TableRow> rows;
  rows.push_back(KeyedRow{{{"name", S("x")}}});
  auto t = table(rows, {"Name"});
  ASSERT_EQ(t.lines()[2], "    ");
}

TEST(table_infers_headers_from_first_keyed_row) {
  std::vector<TableRow> rows;
  rows.push_back(KeyedRow{{{"task", S("write")}, {"done", Scalar(true)}}});
  auto t = table(rows);
  ASSERT_EQ(t.lines()[0], "task   done");
  ASSERT_EQ(t.lines()[2], "write  true");
}

TEST(table_zero_rows_renders_header_and_rule) {
  auto t = table(std::vector<TableRow>{}, {"id", "name"});
  ASSERT_EQ(t.height(), 2);
  ASSERT_EQ(t.lines()[0], "id  name");
  ASSERT_EQ(t.lines()[1], "--------");
}

TEST(table_rejects_missing_headers) {
  ASSERT_THROWS(table(std::vector<TableRow>{}), InvalidInput);
  std::vector<TableRow> rows;
  rows.push_back(PositionalRow{{N(1)}});
  ASSERT_THROWS(table(rows), InvalidInput);
  std::vector<TableRow> empty_keyed;
  empty_keyed.push_back(KeyedRow{});
  ASSERT_THROWS(table(empty_keyed), InvalidInput);
}

TEST(table_rejects_mixed_row_shapes) {
  std::vector<TableRow> rows;
  rows.push_back(KeyedRow{{{"A", N(1)}}});
  rows.push_back(PositionalRow{{N(2)}});
  std::vector<std::string> headers{"A"};
  ASSERT_THROWS(table(rows, headers), InvalidInput);
}

TEST(table_rejects_long_positional_row) {
  std::vector<TableRow> rows;
  rows.push_back(PositionalRow{{N(1), N(2), N(3)}});
  std::vector<std::string> headers{"A", "B"};
  ASSERT_THROWS(table(rows, headers), InvalidInput);
}

TEST(table_rejects_duplicate_headers) {
  std::vector<std::string> headers{"A", "A"};
  ASSERT_THROWS(table(std::vector<TableRow>{}, headers), InvalidInput);
}

TEST(table_rejects_bad_width) {
  std::vector<std::string> headers{"A"};
  ASSERT_THROWS(table(std::vector<TableRow>{}, headers, 0), InvalidConfig);
}

TEST(table_shrinks_and_wraps_to_width) {
  std::vector<TableRow> rows;
  rows.push_back(PositionalRow{{S("short"), S("a rather long description of the item")}});
  auto t = table(rows, {"name", "description"}, 24);
  ASSERT_TRUE(t.width() <= 24);
  ASSERT_TRUE(uniform(t));
  int rules = 0;
  size_t rule_at = 0;
  for (size_t i = 0; i < t.lines().size(); ++i) {
    if (t.lines()[i] == std::string(t.width(), '-')) { ++rules; rule_at = i; }
  }
  ASSERT_EQ(rules, 1);
  // The single data row spans several lines and keeps its words in order.
  ASSERT_TRUE(t.height() - (int)rule_at - 1 > 1);
  std::string body;
  for (size_t i = rule_at + 1; i < t.lines().size(); ++i) body += t.lines()[i] + "\n";
  auto rather = body.find("rather");
  auto item = body.find("item");
  ASSERT_TRUE(rather != std::string::npos);
  ASSERT_TRUE(item != std::string::npos);
  ASSERT_TRUE(rather < item);
}

TEST(table_multiline_cell_pads_row) {
  std::vector<TableRow> rows;
  rows.push_back(PositionalRow{{S("a\nb"), S("x")}});
  auto t = table(rows, {"k", "v"});
  ASSERT_EQ(t.height(), 4);
  ASSERT_EQ(t.lines()[2], "a  x");
  ASSERT_EQ(t.lines()[3], "b   ");
}

TEST(fit_column_widths_keeps_natural_when_it_fits) {
  auto w = fit_column_widths({3, 4}, 20);
  ASSERT_EQ(w, (std::vector<int>{3, 4}));
}

TEST(fit_column_widths_shrinks_proportionally) {
  auto w = fit_column_widths({10, 30}, 22);
  ASSERT_EQ(std::accumulate(w.begin(), w.end(), 0), 20);
  ASSERT_EQ(w, (std::vector<int>{5, 15}));
}

TEST(fit_column_widths_floor_of_one) {
  auto w = fit_column_widths({1, 50}, 12);
  ASSERT_EQ(w[0], 1);
  ASSERT_EQ(w[0] + w[1], 10);
  auto tiny = fit_column_widths({5, 5, 5}, 4);
  ASSERT_EQ(tiny, (std::vector<int>{1, 1, 1}));
}

TEST(table_rendering_is_deterministic) {
  auto a = table(ab_rows(), {"A", "B"}, 40).to_text();
  auto b = table(ab_rows(), {"A", "B"}, 40).to_text();
  ASSERT_EQ(a, b);
}
