#pragma once

#include "fileweave/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fileweave::common {

[[nodiscard]] std::string sha256_hex(std::string_view data);
[[nodiscard]] Result<std::string> sha256_file(const std::filesystem::path &path);
// Fails with Internal when the OpenSSL generator cannot supply bytes.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace fileweave::common
