#include "app/Dispatcher.hpp"
#include "ui/Box.hpp"
#include "ui/Chart.hpp"
#include "ui/Errors.hpp"
#include "ui/List.hpp"
#include "ui/Table.hpp"
#include "ui/Tree.hpp"

namespace tessera::app {

using model::Options;
using ui::Block;

template <typename T>
static const T& expect(const Payload& data, const char* kind, const char* what) {
  const auto* v = std::get_if<T>(&data);
  if (!v) throw ui::InvalidInput(std::string(kind) + ": expected " + what);
  return *v;
}

static Block render_box(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto title = opts.get_string("title");
  const auto width = width_option(opts);
  const int min_h = opts.get_int("min_height", 0);
  if (const auto* text = std::get_if<std::string>(&data))
    return ui::box(*text, title, width, d.config(), min_h);
  if (const auto* block = std::get_if<Block>(&data))
    return ui::box(*block, title, width, d.config(), min_h);
  throw ui::InvalidInput("box: expected text or a rendered block");
}

static Block render_table(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto& t = expect<model::TableData>(data, kinds::Table, "table rows");
  auto headers = opts.get_strings("headers");
  return ui::table(t.rows, headers.empty() ? t.headers : headers, width_option(opts), d.config());
}

static Block render_tree(const Payload& data, const Options&, const Dispatcher&) {
  return ui::tree(expect<model::TreeValue>(data, kinds::Tree, "a nested mapping"));
}

static Block render_list(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto& items = expect<model::ListData>(data, kinds::List, "a list of items");
  return ui::list_display(items, opts.get_bool("numbered", false), opts.get_string("style", "bullet"),
                          width_option(opts), d.config());
}

static Block render_bar_chart(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto& values = expect<model::ChartData>(data, kinds::BarChart, "labelled values");
  return ui::bar_chart(values, width_option(opts), opts.get_bool("show_values", false), d.config());
}

static Block render_progress(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto& p = expect<model::ProgressData>(data, kinds::Progress, "value and total");
  return ui::progress(p.value, p.total, width_option(opts), opts.get_string("label", p.label), d.config());
}

static Block render_sparkline(const Payload& data, const Options& opts, const Dispatcher& d) {
  const auto& series = expect<model::SeriesData>(data, kinds::Sparkline, "a numeric series");
  return ui::sparkline(series, width_option(opts), d.config());
}

void register_builtin_renderers(Dispatcher& d) {
  d.register_kind(kinds::Box, render_box);
  d.register_kind(kinds::Table, render_table);
  d.register_kind(kinds::Tree, render_tree);
  d.register_kind(kinds::List, render_list, Options().set("style", "bullet").set("numbered", false));
  d.register_kind(kinds::BarChart, render_bar_chart, Options().set("show_values", false));
  d.register_kind(kinds::Progress, render_progress);
  d.register_kind(kinds::Sparkline, render_sparkline);
}

} // namespace tessera::app
