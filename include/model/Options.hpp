#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::model {

using OptionValue = std::variant<bool, long long, double, std::string, std::vector<std::string>>;

// Ordered option bag handed to renderers. Getters coerce between
// representations the way config values are read: "42" is an int,
// "true"/"1" is a bool, "a, b" is a string list.
class Options {
public:
  Options& set(const std::string& key, bool value);
  Options& set(const std::string& key, int value);
  Options& set(const std::string& key, long long value);
  Options& set(const std::string& key, double value);
  Options& set(const std::string& key, const char* value);
  Options& set(const std::string& key, std::string value);
  Options& set(const std::string& key, std::vector<std::string> value);

  [[nodiscard]] bool has(std::string_view key) const;
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const std::vector<std::pair<std::string, OptionValue>>& entries() const { return entries_; }

  // `def` when absent or when the value does not fit in an int.
  [[nodiscard]] int get_int(std::string_view key, int def = 0) const;
  [[nodiscard]] double get_double(std::string_view key, double def = 0.0) const;
  [[nodiscard]] bool get_bool(std::string_view key, bool def = false) const;
  [[nodiscard]] std::string get_string(std::string_view key, const std::string& def = "") const;
  [[nodiscard]] std::vector<std::string> get_strings(std::string_view key) const;

  // `overrides` wins; key order follows `defaults`, new keys appended.
  [[nodiscard]] static Options merge(const Options& defaults, const Options& overrides);

private:
  Options& put(const std::string& key, OptionValue value);
  [[nodiscard]] const OptionValue* find(std::string_view key) const;

  std::vector<std::pair<std::string, OptionValue>> entries_;
};

} // namespace tessera::model
