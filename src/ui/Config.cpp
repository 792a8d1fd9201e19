#include "ui/Config.hpp"
#include "ui/Errors.hpp"
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tessera::ui {

int RenderConfig::resolve_width(std::optional<int> override) const {
  int w = override.value_or(width);
  if (w <= 0) throw InvalidConfig("width must be positive, got " + std::to_string(w));
  return w;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TESSERA_", 0) == 0) {
    alt = std::string("tessera_") + n.substr(8);
  } else if (n.rfind("tessera_", 0) == 0) {
    alt = std::string("TESSERA_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc() || ptr != sv.data() + sv.size()) return defv;
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tessera/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tessera/config.toml";
  return {};
}

// Resolve the default width from TOML -> env -> compiled default.
// Unusable values are reported and skipped.
static int resolve_default_width(const tessera::util::TomlReader& toml, bool have_toml) {
  if (have_toml && toml.has("render", "width")) {
    int w = toml.get_int("render", "width", 0);
    if (w > 0) return w;
    std::fprintf(stderr, "tessera: config: ignoring [render] width = \"%s\" (expected a positive integer)\n",
                 toml.get_string("render", "width").c_str());
  }
  if (const char* env = getenv_compat("TESSERA_WIDTH")) {
    int w = getenv_int("TESSERA_WIDTH", 0);
    if (w > 0) return w;
    std::fprintf(stderr, "tessera: config: ignoring TESSERA_WIDTH=\"%s\" (expected a positive integer)\n", env);
  }
  return kDefaultWidth;
}

Settings settings_from_toml(const tessera::util::TomlReader& toml, bool have_toml) {
  Settings out;
  out.render.width = resolve_default_width(toml, have_toml);
  if (!have_toml) return out;
  for (const auto& section : toml.section_names()) {
    if (section.empty() || section == "render") continue;
    model::Options opts;
    for (const auto& [k, v] : toml.entries(section)) opts.set(k, v);
    out.kind_defaults.emplace_back(section, std::move(opts));
  }
  return out;
}

Settings load_settings(const std::string& path) {
  tessera::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  return settings_from_toml(toml, have_toml);
}

} // namespace tessera::ui
