#include "fileweave/scan/scanner.hpp"

#include "fileweave/observability/global.hpp"

#include <algorithm>

namespace fileweave::scan {

namespace {

constexpr const char *COMPONENT = "scan";

template <typename T> common::Result<T> failed(common::Error error) {
  observability::record_error(COMPONENT, error.message);
  return common::Result<T>::failure(std::move(error));
}

} // namespace

common::Status DirectoryScanner::include(const std::string &pattern) {
  auto compiled = common::GlobPattern::compile(pattern);
  if (!compiled.ok()) {
    return failed<void>(compiled.error_info());
  }
  patterns_.push_back(std::move(compiled.value()));
  return common::Status::success();
}

bool DirectoryScanner::matches(const std::filesystem::path &relative) const {
  if (patterns_.empty()) {
    return true;
  }
  const std::string relative_str = relative.generic_string();
  const std::string filename = relative.filename().string();
  return std::any_of(patterns_.begin(), patterns_.end(), [&](const common::GlobPattern &glob) {
    const bool path_pattern = glob.pattern().find('/') != std::string::npos;
    return glob.matches(path_pattern ? relative_str : filename);
  });
}

common::Result<std::vector<std::filesystem::path>>
DirectoryScanner::scan(const std::filesystem::path &root) const {
  using Paths = std::vector<std::filesystem::path>;

  std::error_code ec;
  const auto status = std::filesystem::status(root, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return failed<Paths>(common::from_error_code(root, "stat", ec));
  }
  if (!std::filesystem::exists(status)) {
    return failed<Paths>(
        common::make_error(common::ErrorKind::NotFound, root, "scan root does not exist"));
  }
  if (!std::filesystem::is_directory(status)) {
    return failed<Paths>(
        common::make_error(common::ErrorKind::InvalidPath, root, "scan root is not a directory"));
  }

  Paths found;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return failed<Paths>(common::from_error_code(root, "open directory", ec));
  }
  for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) {
      return failed<Paths>(common::from_error_code(root, "walk directory", ec));
    }
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    if (matches(it->path().lexically_relative(root))) {
      found.push_back(it->path());
    }
  }
  if (ec) {
    return failed<Paths>(common::from_error_code(root, "walk directory", ec));
  }

  std::sort(found.begin(), found.end());
  observability::record_scan(root.string(), found.size());
  return common::Result<Paths>::success(std::move(found));
}

} // namespace fileweave::scan
