#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::util {

// Minimal TOML subset: [section] headers, key = value pairs, quoted strings,
// '#' comment lines. Keys before the first header land in section "".
class TomlReader {
public:
  using Entries = std::vector<std::pair<std::string, std::string>>;

  bool load(const std::string& path);
  void parse(std::istream& in);

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const;
  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const;
  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

  [[nodiscard]] std::vector<std::string> section_names() const;
  // Raw key/value strings of a section, in file order; empty if absent.
  [[nodiscard]] Entries entries(std::string_view section) const;

private:
  struct Section {
    Entries entries;
    [[nodiscard]] const std::string* get(std::string_view key) const;
    void set(const std::string& key, const std::string& val);
  };

  Section& ensure_section(const std::string& name);
  [[nodiscard]] const Section* find_section(std::string_view name) const;

  std::vector<std::pair<std::string, Section>> sections_;
};

} // namespace tessera::util
