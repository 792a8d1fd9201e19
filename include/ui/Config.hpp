#pragma once

#include "model/Options.hpp"
#include "util/TomlReader.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tessera::ui {

inline constexpr int kDefaultWidth = 80;

// Layout defaults shared by every renderer. Held by value and passed into
// each render call; a per-call width always wins over `width`.
struct RenderConfig {
  int width{kDefaultWidth};

  // Per-call override if present, else `width`. Raises InvalidConfig for <= 0.
  [[nodiscard]] int resolve_width(std::optional<int> override = std::nullopt) const;
};

// Everything read at startup: the render defaults plus per-kind option
// defaults taken from config sections named after a display kind.
struct Settings {
  RenderConfig render;
  std::vector<std::pair<std::string, model::Options>> kind_defaults;
};

// Environment variable helpers (TESSERA_X and tessera_x are equivalent)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/tessera/config.toml, else ~/.config/tessera/config.toml
std::string config_file_path();

// TOML -> env -> compiled default
Settings settings_from_toml(const tessera::util::TomlReader& toml, bool have_toml);
Settings load_settings(const std::string& path = config_file_path());

} // namespace tessera::ui
