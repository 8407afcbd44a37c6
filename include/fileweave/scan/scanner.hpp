#pragma once

#include "fileweave/common/glob.hpp"
#include "fileweave/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fileweave::scan {

// Patterns containing '/' match the path relative to the scan root, others
// match the file name alone. With no patterns every regular file matches.
class DirectoryScanner {
public:
  [[nodiscard]] common::Status include(const std::string &pattern);

  // Sorted list of regular files under root matching at least one pattern.
  [[nodiscard]] common::Result<std::vector<std::filesystem::path>>
  scan(const std::filesystem::path &root) const;

  [[nodiscard]] std::size_t pattern_count() const { return patterns_.size(); }

private:
  [[nodiscard]] bool matches(const std::filesystem::path &relative) const;

  std::vector<common::GlobPattern> patterns_;
};

} // namespace fileweave::scan
