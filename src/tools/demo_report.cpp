// Renders a small todo report through the dispatcher: a custom "report" kind
// composes a boxed table, a status bar chart and a completion bar.

#include "app/Dispatcher.hpp"
#include "ui/Compose.hpp"
#include "ui/Config.hpp"
#include "ui/Errors.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using tessera::app::Dispatcher;
using tessera::app::Payload;
using tessera::model::Options;
using namespace tessera;

static void usage() {
  std::fprintf(stderr, "Usage: tessera-demo [--width N] [--config PATH]\n");
}

static bool parse_positive(std::string_view sv, int& out) {
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc() && ptr == sv.data() + sv.size() && out > 0;
}

static model::TableData sample_todos() {
  model::TableData t;
  t.headers = {"id", "task", "status"};
  auto row = [](long long id, std::string task, std::string status) {
    return model::PositionalRow{{id, std::move(task), std::move(status)}};
  };
  t.rows.emplace_back(row(1, "Write the layout primitives", "done"));
  t.rows.emplace_back(row(2, "Shrink wide tables to fit", "done"));
  t.rows.emplace_back(row(3, "Nested tree guides", "doing"));
  t.rows.emplace_back(row(4, "Config file defaults", "todo"));
  t.rows.emplace_back(row(5, "Package the demo", "todo"));
  return t;
}

// Status column -> ordered counts
static model::ChartData status_counts(const model::TableData& t) {
  model::ChartData out;
  for (const auto& r : t.rows) {
    const auto* pos = std::get_if<model::PositionalRow>(&r);
    if (!pos || pos->cells.size() < 3) continue;
    auto status = model::scalar_text(pos->cells[2]);
    bool found = false;
    for (auto& [label, n] : out) {
      if (label == status) { n += 1; found = true; break; }
    }
    if (!found) out.emplace_back(status, 1);
  }
  return out;
}

static ui::Block render_report(const Payload& data, const Options& opts, const Dispatcher& self) {
  const auto* todos = std::get_if<model::TableData>(&data);
  if (!todos) throw ui::InvalidInput("report expects table rows");

  auto counts = status_counts(*todos);
  double done = 0;
  for (const auto& [label, n] : counts)
    if (label == "done") done = n;

  int inner = self.config().resolve_width(app::width_option(opts)) - 4;
  Options sub;
  sub.set("width", inner);

  auto table = self.render(app::kinds::Table, *todos, sub);
  auto chart = self.render(app::kinds::BarChart, counts, Options(sub).set("show_values", true));
  // "complete [" + cells + "] 100%"
  const std::string label = "complete";
  int cells = std::max(1, inner - (int)label.size() - 8);
  auto bar = self.render(app::kinds::Progress,
                         model::ProgressData{done, (double)todos->rows.size(), label},
                         Options().set("width", cells));
  auto body = ui::compose({table, chart, bar}, 1);

  Options box_opts;
  box_opts.set("title", opts.get_string("title", "Todo Summary"));
  if (auto w = app::width_option(opts)) box_opts.set("width", *w);
  return self.render(app::kinds::Box, body, box_opts);
}

int main(int argc, char** argv) {
  std::optional<int> width;
  std::string config_path = ui::config_file_path();
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--width" && i + 1 < argc) {
      int w = 0;
      if (!parse_positive(argv[++i], w)) { usage(); return 2; }
      width = w;
    } else if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "-h" || a == "--help") {
      std::cout << "Usage: tessera-demo [--width N] [--config PATH]\n";
      return 0;
    } else {
      usage();
      return 2;
    }
  }

  try {
    Dispatcher d(ui::load_settings(config_path));
    if (width) d.configure(*width);
    d.register_kind("report", render_report, Options().set("title", "Todo Summary"));
    std::cout << d.render_text({"report", {}}, sample_todos()) << "\n";
  } catch (const ui::RenderError& e) {
    std::fprintf(stderr, "tessera: demo: %s\n", e.what());
    return 1;
  }
  return 0;
}
