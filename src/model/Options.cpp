#include "model/Options.hpp"
#include "ui/Text.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tessera::model {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
  return sv;
}

static bool parse_ll(std::string_view sv, long long& out) {
  sv = trim(sv);
  if (sv.empty()) return false;
  if (sv.front() == '+') sv.remove_prefix(1);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc() && ptr == sv.data() + sv.size();
}

static bool parse_double(std::string_view sv, double& out) {
  std::string s(trim(sv));
  if (s.empty()) return false;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return false;
  out = v;
  return true;
}

// Values outside int's range (and NaN) do not convert.
static bool fits_int(long long n) {
  return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

static bool fits_int(double d) {
  return std::isfinite(d) && d >= (double)std::numeric_limits<int>::min()
         && d <= (double)std::numeric_limits<int>::max();
}

static bool parse_bool(std::string_view sv, bool& out) {
  sv = trim(sv);
  if (sv == "true" || sv == "True" || sv == "TRUE" || sv == "1") { out = true; return true; }
  if (sv == "false" || sv == "False" || sv == "FALSE" || sv == "0") { out = false; return true; }
  return false;
}

Options& Options::put(const std::string& key, OptionValue value) {
  for (auto& [k, v] : entries_) {
    if (k == key) { v = std::move(value); return *this; }
  }
  entries_.emplace_back(key, std::move(value));
  return *this;
}

Options& Options::set(const std::string& key, bool value) { return put(key, value); }
Options& Options::set(const std::string& key, int value) { return put(key, (long long)value); }
Options& Options::set(const std::string& key, long long value) { return put(key, value); }
Options& Options::set(const std::string& key, double value) { return put(key, value); }
Options& Options::set(const std::string& key, const char* value) { return put(key, std::string(value)); }
Options& Options::set(const std::string& key, std::string value) { return put(key, std::move(value)); }
Options& Options::set(const std::string& key, std::vector<std::string> value) { return put(key, std::move(value)); }

const OptionValue* Options::find(std::string_view key) const {
  for (const auto& [k, v] : entries_)
    if (k == key) return &v;
  return nullptr;
}

bool Options::has(std::string_view key) const { return find(key) != nullptr; }

int Options::get_int(std::string_view key, int def) const {
  const auto* v = find(key);
  if (!v) return def;
  if (auto* n = std::get_if<long long>(v)) return fits_int(*n) ? (int)*n : def;
  if (auto* d = std::get_if<double>(v)) return fits_int(*d) ? (int)*d : def;
  if (auto* b = std::get_if<bool>(v)) return *b ? 1 : 0;
  if (auto* s = std::get_if<std::string>(v)) {
    long long n = 0;
    return parse_ll(*s, n) && fits_int(n) ? (int)n : def;
  }
  return def;
}

double Options::get_double(std::string_view key, double def) const {
  const auto* v = find(key);
  if (!v) return def;
  if (auto* d = std::get_if<double>(v)) return *d;
  if (auto* n = std::get_if<long long>(v)) return (double)*n;
  if (auto* s = std::get_if<std::string>(v)) {
    double d = 0.0;
    return parse_double(*s, d) ? d : def;
  }
  return def;
}

bool Options::get_bool(std::string_view key, bool def) const {
  const auto* v = find(key);
  if (!v) return def;
  if (auto* b = std::get_if<bool>(v)) return *b;
  if (auto* n = std::get_if<long long>(v)) return *n != 0;
  if (auto* s = std::get_if<std::string>(v)) {
    bool b = def;
    return parse_bool(*s, b) ? b : def;
  }
  return def;
}

std::string Options::get_string(std::string_view key, const std::string& def) const {
  const auto* v = find(key);
  if (!v) return def;
  if (auto* s = std::get_if<std::string>(v)) return *s;
  if (auto* b = std::get_if<bool>(v)) return *b ? "true" : "false";
  if (auto* n = std::get_if<long long>(v)) return std::to_string(*n);
  if (auto* d = std::get_if<double>(v)) return tessera::ui::format_number(*d);
  return def;
}

std::vector<std::string> Options::get_strings(std::string_view key) const {
  const auto* v = find(key);
  if (!v) return {};
  if (auto* list = std::get_if<std::vector<std::string>>(v)) return *list;
  auto s = get_string(key);
  std::vector<std::string> out;
  std::string_view rest = s;
  while (!rest.empty()) {
    auto comma = rest.find(',');
    auto item = trim(rest.substr(0, comma));
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
  }
  return out;
}

Options Options::merge(const Options& defaults, const Options& overrides) {
  Options out = defaults;
  for (const auto& [k, v] : overrides.entries_) out.put(k, v);
  return out;
}

} // namespace tessera::model
