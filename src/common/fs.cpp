#include "fileweave/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>

namespace fileweave::common {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

bool is_env_name_char(const char ch, const bool first) {
  const auto c = static_cast<unsigned char>(ch);
  return std::isalpha(c) != 0 || ch == '_' || (!first && std::isdigit(c) != 0);
}

std::string env_or_empty(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return value == nullptr ? std::string() : std::string(value);
}

} // namespace

std::string trim(const std::string_view input) {
  const auto first = input.find_first_not_of(WHITESPACE);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(WHITESPACE);
  return std::string(input.substr(first, last - first + 1));
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  const std::string home = env_or_empty("HOME");
  if (home.empty()) {
    return Result<std::filesystem::path>::failure(
        make_error(ErrorKind::NotFound, "HOME is not set"));
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Status ensure_parent_dir(const std::filesystem::path &path) {
  const auto parent = path.parent_path();
  if (parent.empty()) {
    return Status::success();
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return Status::failure(from_error_code(parent, "create directory", ec));
  }
  return Status::success();
}

std::string expand_path(const std::string &value) {
  std::string out;
  out.reserve(value.size());

  std::size_t i = 0;
  if (!value.empty() && value[0] == '~' && (value.size() == 1 || value[1] == '/')) {
    if (auto home = home_dir(); home.ok()) {
      out += home.value().string();
      i = 1;
    }
  }

  while (i < value.size()) {
    if (value[i] != '$') {
      out += value[i++];
      continue;
    }
    const bool braced = i + 1 < value.size() && value[i + 1] == '{';
    std::size_t name_begin = i + (braced ? 2 : 1);
    std::size_t name_end = name_begin;
    while (name_end < value.size() && is_env_name_char(value[name_end], name_end == name_begin)) {
      ++name_end;
    }
    if (name_end == name_begin || (braced && (name_end >= value.size() || value[name_end] != '}'))) {
      out += value[i++];
      continue;
    }
    out += env_or_empty(value.substr(name_begin, name_end - name_begin));
    i = name_end + (braced ? 1 : 0);
  }
  return out;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  for (auto p_it = parent.begin(); p_it != parent.end(); ++p_it, ++c_it) {
    // A trailing separator shows up as an empty final component.
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      return true;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }
  return true;
}

std::size_t path_depth(const std::filesystem::path &path) {
  const auto relative = path.relative_path();
  return static_cast<std::size_t>(
      std::count_if(relative.begin(), relative.end(),
                    [](const std::filesystem::path &part) { return !part.empty() && part != "."; }));
}

} // namespace fileweave::common
