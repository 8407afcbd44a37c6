#pragma once

#include "fileweave/common/result.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace fileweave::common {

[[nodiscard]] bool has_glob_chars(std::string_view value);

// Translates `*`, `**`, `?` and `[...]` into an anchored ECMAScript regex.
// `*` and `?` never cross a '/', `**/` matches zero or more directories.
[[nodiscard]] Result<std::string> glob_to_regex(std::string_view pattern);

class GlobPattern {
public:
  [[nodiscard]] static Result<GlobPattern> compile(const std::string &pattern);

  [[nodiscard]] bool matches(const std::string &path) const;
  [[nodiscard]] const std::string &pattern() const { return pattern_; }

private:
  GlobPattern(std::string pattern, std::regex regex);

  std::string pattern_;
  std::regex regex_;
};

[[nodiscard]] bool glob_match(const std::string &path, const std::string &pattern);

} // namespace fileweave::common
