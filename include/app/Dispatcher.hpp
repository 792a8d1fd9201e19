#pragma once

#include "model/Data.hpp"
#include "model/Options.hpp"
#include "ui/Block.hpp"
#include "ui/Config.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::app {

// Data a collaborator hands to dispatch; each kind accepts one or two of these.
using Payload = std::variant<std::string, ui::Block, model::TableData, model::TreeValue,
                             model::ListData, model::ChartData, model::ProgressData,
                             model::SeriesData>;

namespace kinds {
inline constexpr const char* Box = "box";
inline constexpr const char* Table = "table";
inline constexpr const char* Tree = "tree";
inline constexpr const char* List = "list";
inline constexpr const char* BarChart = "bar_chart";
inline constexpr const char* Progress = "progress";
inline constexpr const char* Sparkline = "sparkline";
} // namespace kinds

struct DisplaySpec {
  std::string kind;
  model::Options options;
};

class Dispatcher {
public:
  // Renderers get the dispatcher back so they can render nested sections.
  using Renderer = std::function<ui::Block(const Payload&, const model::Options&, const Dispatcher&)>;

  explicit Dispatcher(ui::RenderConfig cfg = {});
  explicit Dispatcher(const ui::Settings& settings);

  // Adds or replaces the renderer for `kind`. `defaults` sit under the
  // config-file defaults and the per-call options.
  void register_kind(const std::string& kind, Renderer fn, model::Options defaults = {});
  [[nodiscard]] bool has_kind(std::string_view kind) const;
  [[nodiscard]] std::vector<std::string> registered_kinds() const;

  // Options from configuration for `kind`; they apply whether or not the
  // kind is registered yet.
  void set_config_defaults(const std::string& kind, model::Options defaults);

  // Raises UnknownDisplayKind for unregistered kinds; renderer errors pass through.
  [[nodiscard]] ui::Block render(const DisplaySpec& spec, const Payload& data) const;
  [[nodiscard]] ui::Block render(const std::string& kind, const Payload& data,
                                 const model::Options& options = {}) const;
  [[nodiscard]] std::string render_text(const DisplaySpec& spec, const Payload& data) const;

  // Options after merging registration defaults, config defaults and `options`.
  [[nodiscard]] model::Options effective_options(const std::string& kind, const model::Options& options) const;

  [[nodiscard]] const ui::RenderConfig& config() const { return config_; }
  // Raises InvalidConfig for width <= 0.
  void configure(int width);

private:
  struct Entry {
    Renderer fn;
    model::Options defaults;
  };

  [[nodiscard]] const Entry* find(std::string_view kind) const;
  [[nodiscard]] const model::Options* find_config_defaults(std::string_view kind) const;

  ui::RenderConfig config_;
  std::vector<std::pair<std::string, Entry>> entries_;
  std::vector<std::pair<std::string, model::Options>> config_defaults_;
};

// Registers box, table, tree, list, bar_chart, progress and sparkline.
void register_builtin_renderers(Dispatcher& d);

// The "width" option as a per-call override, if set. Raises InvalidConfig
// when it is set but is not a positive int.
std::optional<int> width_option(const model::Options& opts);

} // namespace tessera::app
