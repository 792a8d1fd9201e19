#include "ui/Table.hpp"
#include "ui/Errors.hpp"
#include "ui/Text.hpp"
#include <algorithm>
#include <numeric>

namespace tessera::ui {

using model::KeyedRow;
using model::PositionalRow;
using model::TableRow;

namespace {

using Grid = std::vector<std::vector<std::string>>;

// Resolve headers and flatten rows to strings, rejecting anything ambiguous.
std::vector<std::string> resolve_headers(const std::vector<TableRow>& rows,
                                         const std::vector<std::string>& headers) {
  if (!rows.empty()) {
    size_t shape = rows.front().index();
    for (size_t i = 1; i < rows.size(); ++i) {
      if (rows[i].index() != shape)
        throw InvalidInput("table: row " + std::to_string(i) + " mixes positional and keyed rows");
    }
  }
  std::vector<std::string> out = headers;
  if (out.empty()) {
    if (rows.empty())
      throw InvalidInput("table: headers are required when there are no rows");
    const auto* keyed = std::get_if<KeyedRow>(&rows.front());
    if (!keyed)
      throw InvalidInput("table: positional rows need explicit headers");
    for (const auto& [k, v] : keyed->cells) out.push_back(k);
    if (out.empty())
      throw InvalidInput("table: cannot infer headers from an empty first row");
  }
  for (size_t i = 0; i < out.size(); ++i) {
    for (size_t j = i + 1; j < out.size(); ++j) {
      if (out[i] == out[j]) throw InvalidInput("table: duplicate header \"" + out[i] + "\"");
    }
  }
  return out;
}

Grid extract_cells(const std::vector<TableRow>& rows, const std::vector<std::string>& headers) {
  Grid grid;
  grid.reserve(rows.size());
  for (size_t r = 0; r < rows.size(); ++r) {
    std::vector<std::string> cells(headers.size());
    if (const auto* pos = std::get_if<PositionalRow>(&rows[r])) {
      if (pos->cells.size() > headers.size())
        throw InvalidInput("table: row " + std::to_string(r) + " has " + std::to_string(pos->cells.size())
                           + " cells but only " + std::to_string(headers.size()) + " headers");
      for (size_t c = 0; c < pos->cells.size(); ++c) cells[c] = model::scalar_text(pos->cells[c]);
    } else {
      const auto& keyed = std::get<KeyedRow>(rows[r]);
      for (size_t c = 0; c < headers.size(); ++c) {
        if (const auto* v = keyed.find(headers[c])) cells[c] = model::scalar_text(*v);
      }
    }
    grid.push_back(std::move(cells));
  }
  return grid;
}

int natural_width(const std::string& cell) {
  int w = 0;
  for (const auto& ln : split_lines(cell)) w = std::max(w, display_cols(sanitize(ln)));
  return w;
}

// A cell as lines no wider than w
std::vector<std::string> cell_lines(const std::string& cell, int w) {
  std::vector<std::string> out;
  for (auto& ln : split_lines(cell)) {
    ln = sanitize(ln);
    if (display_cols(ln) <= w) { out.push_back(std::move(ln)); continue; }
    auto wrapped = wrap(ln, w);
    out.insert(out.end(), wrapped.begin(), wrapped.end());
  }
  return out;
}

void emit_row(const std::vector<std::string>& cells, const std::vector<int>& widths,
              std::vector<std::string>& out) {
  std::vector<std::vector<std::string>> cols;
  cols.reserve(cells.size());
  size_t height = 1;
  for (size_t c = 0; c < cells.size(); ++c) {
    cols.push_back(cell_lines(cells[c], widths[c]));
    height = std::max(height, cols.back().size());
  }
  const std::string gap(kTableGap, ' ');
  for (size_t li = 0; li < height; ++li) {
    std::string line;
    for (size_t c = 0; c < cols.size(); ++c) {
      if (c) line += gap;
      line += align(li < cols[c].size() ? cols[c][li] : std::string(), widths[c]);
    }
    out.push_back(std::move(line));
  }
}

} // namespace

std::vector<int> fit_column_widths(const std::vector<int>& natural, int target, int gap) {
  const int n = (int)natural.size();
  if (n == 0) return {};
  std::vector<int> out(natural.size());
  for (int i = 0; i < n; ++i) out[i] = std::max(1, natural[i]);
  const int gaps = gap * (n - 1);
  const long long sum = std::accumulate(out.begin(), out.end(), 0LL);
  if (sum + gaps <= target) return out;

  const int avail = target - gaps;
  if (avail <= n) return std::vector<int>(natural.size(), 1);

  // Scale each column by avail / sum, then hand out the leftover cells to the
  // largest fractional remainders.
  std::vector<double> rem(natural.size());
  int used = 0;
  for (int i = 0; i < n; ++i) {
    double exact = (double)out[i] * (double)avail / (double)sum;
    int w = std::max(1, (int)exact);
    rem[i] = exact - (int)exact;
    out[i] = w;
    used += w;
  }
  std::vector<int> order(natural.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](int a, int b){ return rem[a] > rem[b]; });
  for (size_t k = 0; used < avail; k = (k + 1) % order.size()) {
    out[order[k]] += 1;
    used += 1;
  }
  // Floors of 1 can push us over; take back from the widest columns.
  while (used > avail) {
    auto it = std::max_element(out.begin(), out.end());
    if (*it <= 1) break;
    *it -= 1;
    used -= 1;
  }
  return out;
}

Block table(const std::vector<TableRow>& rows, const std::vector<std::string>& headers,
            std::optional<int> width, const RenderConfig& cfg) {
  const int target = cfg.resolve_width(width);
  auto heads = resolve_headers(rows, headers);
  auto grid = extract_cells(rows, heads);

  std::vector<int> natural(heads.size(), 1);
  for (size_t c = 0; c < heads.size(); ++c) {
    natural[c] = std::max(natural[c], natural_width(heads[c]));
    for (const auto& row : grid) natural[c] = std::max(natural[c], natural_width(row[c]));
  }
  auto widths = fit_column_widths(natural, target, kTableGap);
  int table_w = std::accumulate(widths.begin(), widths.end(), 0) + kTableGap * ((int)widths.size() - 1);

  std::vector<std::string> lines;
  emit_row(heads, widths, lines);
  lines.push_back(hr(table_w));
  for (const auto& row : grid) emit_row(row, widths, lines);
  return Block(std::move(lines));
}

Block table(const model::TableData& data, std::optional<int> width, const RenderConfig& cfg) {
  return table(data.rows, data.headers, width, cfg);
}

} // namespace tessera::ui
