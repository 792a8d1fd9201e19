#include "util/TomlReader.hpp"
#include <cctype>
#include <charconv>
#include <fstream>

namespace tessera::util {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

bool TomlReader::load(const std::string& path) {
  sections_.clear();
  std::ifstream in(path);
  if (!in.is_open()) return false;
  parse(in);
  return true;
}

void TomlReader::parse(std::istream& in) {
  std::string current_section;
  std::string line;
  while (std::getline(in, line)) {
    auto sv = trim(line);
    if (sv.empty() || sv[0] == '#') continue;
    if (sv.front() == '[' && sv.back() == ']') {
      current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
      ensure_section(current_section);
      continue;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) continue;
    std::string key(trim(sv.substr(0, eq)));
    std::string val(trim(sv.substr(eq + 1)));
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
      val = val.substr(1, val.size() - 2);
    ensure_section(current_section).set(key, val);
  }
}

std::string TomlReader::get_string(std::string_view section, std::string_view key,
                                   const std::string& def) const {
  const auto* s = find_section(section);
  const auto* v = s ? s->get(key) : nullptr;
  return v ? *v : def;
}

int TomlReader::get_int(std::string_view section, std::string_view key, int def) const {
  auto val = get_string(section, key);
  auto sv = trim(val);
  if (sv.empty()) return def;
  int out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc() || ptr != sv.data() + sv.size()) return def;
  return out;
}

bool TomlReader::has(std::string_view section, std::string_view key) const {
  const auto* s = find_section(section);
  return s && s->get(key);
}

std::vector<std::string> TomlReader::section_names() const {
  std::vector<std::string> out;
  out.reserve(sections_.size());
  for (const auto& [n, s] : sections_) out.push_back(n);
  return out;
}

TomlReader::Entries TomlReader::entries(std::string_view section) const {
  const auto* s = find_section(section);
  return s ? s->entries : Entries{};
}

const std::string* TomlReader::Section::get(std::string_view key) const {
  for (const auto& [k, v] : entries)
    if (k == key) return &v;
  return nullptr;
}

void TomlReader::Section::set(const std::string& key, const std::string& val) {
  for (auto& [k, v] : entries) {
    if (k == key) { v = val; return; }
  }
  entries.emplace_back(key, val);
}

TomlReader::Section& TomlReader::ensure_section(const std::string& name) {
  for (auto& [n, s] : sections_)
    if (n == name) return s;
  sections_.emplace_back(name, Section{});
  return sections_.back().second;
}

const TomlReader::Section* TomlReader::find_section(std::string_view name) const {
  for (const auto& [n, s] : sections_)
    if (n == name) return &s;
  return nullptr;
}

} // namespace tessera::util
