#pragma once

#include "fileweave/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fileweave::common {

// Flat view of a TOML file: `[section]` headers are folded into dotted keys
// and values are kept as raw text until a typed getter reads them.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] const std::string *find(const std::string &key) const;
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::optional<std::uint64_t> get_optional_u64(const std::string &key) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

} // namespace fileweave::common
