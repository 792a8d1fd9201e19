#include "app/Dispatcher.hpp"
#include "ui/Errors.hpp"
#include <cstdio>

namespace tessera::app {

Dispatcher::Dispatcher(ui::RenderConfig cfg) : config_(cfg) {
  (void)config_.resolve_width();
  register_builtin_renderers(*this);
}

Dispatcher::Dispatcher(const ui::Settings& settings) : Dispatcher(settings.render) {
  for (const auto& [kind, opts] : settings.kind_defaults) set_config_defaults(kind, opts);
}

void Dispatcher::register_kind(const std::string& kind, Renderer fn, model::Options defaults) {
  if (kind.empty()) throw ui::InvalidInput("dispatch: display kind must not be empty");
  if (!fn) throw ui::InvalidInput("dispatch: renderer for \"" + kind + "\" is empty");
  for (auto& [k, e] : entries_) {
    if (k == kind) {
      std::fprintf(stderr, "tessera: dispatch: replacing renderer for kind \"%s\"\n", kind.c_str());
      e = Entry{std::move(fn), std::move(defaults)};
      return;
    }
  }
  entries_.emplace_back(kind, Entry{std::move(fn), std::move(defaults)});
}

bool Dispatcher::has_kind(std::string_view kind) const { return find(kind) != nullptr; }

std::vector<std::string> Dispatcher::registered_kinds() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [k, e] : entries_) out.push_back(k);
  return out;
}

void Dispatcher::set_config_defaults(const std::string& kind, model::Options defaults) {
  for (auto& [k, o] : config_defaults_) {
    if (k == kind) { o = model::Options::merge(o, defaults); return; }
  }
  config_defaults_.emplace_back(kind, std::move(defaults));
}

const Dispatcher::Entry* Dispatcher::find(std::string_view kind) const {
  for (const auto& [k, e] : entries_)
    if (k == kind) return &e;
  return nullptr;
}

const model::Options* Dispatcher::find_config_defaults(std::string_view kind) const {
  for (const auto& [k, o] : config_defaults_)
    if (k == kind) return &o;
  return nullptr;
}

model::Options Dispatcher::effective_options(const std::string& kind, const model::Options& options) const {
  model::Options merged;
  if (const auto* e = find(kind)) merged = e->defaults;
  if (const auto* c = find_config_defaults(kind)) merged = model::Options::merge(merged, *c);
  return model::Options::merge(merged, options);
}

ui::Block Dispatcher::render(const DisplaySpec& spec, const Payload& data) const {
  const auto* e = find(spec.kind);
  if (!e) throw ui::UnknownDisplayKind("dispatch: no renderer registered for kind \"" + spec.kind + "\"");
  return e->fn(data, effective_options(spec.kind, spec.options), *this);
}

ui::Block Dispatcher::render(const std::string& kind, const Payload& data, const model::Options& options) const {
  return render(DisplaySpec{kind, options}, data);
}

std::string Dispatcher::render_text(const DisplaySpec& spec, const Payload& data) const {
  return render(spec, data).to_text();
}

void Dispatcher::configure(int width) {
  ui::RenderConfig next = config_;
  next.width = width;
  (void)next.resolve_width();
  config_ = next;
}

std::optional<int> width_option(const model::Options& opts) {
  if (!opts.has("width")) return std::nullopt;
  int w = opts.get_int("width", 0);
  if (w <= 0)
    throw ui::InvalidConfig("width option must be a positive integer, got \"" + opts.get_string("width") + "\"");
  return w;
}

} // namespace tessera::app
