#pragma once

#include "fileweave/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fileweave::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] std::string to_lower(std::string value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
// Creates every missing ancestor of path. A path without a parent succeeds.
[[nodiscard]] Status ensure_parent_dir(const std::filesystem::path &path);
// Expands a leading "~" and "$VAR" / "${VAR}" references. Unset variables
// expand to nothing.
[[nodiscard]] std::string expand_path(const std::string &value);

// Component-wise prefix test; "/tmp/ab" is not under "/tmp/a".
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);
// Number of named components, ignoring the root and ".".
[[nodiscard]] std::size_t path_depth(const std::filesystem::path &path);

} // namespace fileweave::common
