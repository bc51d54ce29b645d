#pragma once

#include "hitlgate/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hitlgate::common {

/// Flat view of a TOML file: `[section]` headers are folded into dotted keys and each value
/// keeps its raw text until a typed getter reads it. Supports the subset the config file
/// uses: strings (basic and literal), integers (with `_` separators), booleans, floats and
/// single- or multi-line arrays of those.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace hitlgate::common
