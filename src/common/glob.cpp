#include "fileweave/common/glob.hpp"

namespace fileweave::common {

bool has_glob_chars(std::string_view value) {
  return value.find('*') != std::string_view::npos || value.find('?') != std::string_view::npos ||
         value.find('[') != std::string_view::npos;
}

Result<std::string> glob_to_regex(std::string_view pattern) {
  if (pattern.empty()) {
    return Result<std::string>::failure(invalid_pattern(std::string(pattern), "empty pattern"));
  }

  std::string out;
  out.reserve(pattern.size() * 2 + 4);
  out += '^';

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    switch (ch) {
    case '*':
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        ++i;
        if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
          ++i;
          out += "(?:.*/)?";
        } else {
          out += ".*";
        }
      } else {
        out += "[^/]*";
      }
      break;
    case '?':
      out += "[^/]";
      break;
    case '[': {
      const auto close = pattern.find(']', i + 1);
      if (close == std::string_view::npos) {
        return Result<std::string>::failure(
            invalid_pattern(std::string(pattern), "unterminated character class"));
      }
      std::string_view body = pattern.substr(i + 1, close - i - 1);
      if (body.empty()) {
        return Result<std::string>::failure(
            invalid_pattern(std::string(pattern), "empty character class"));
      }
      out += '[';
      if (body.front() == '!') {
        out += '^';
        body.remove_prefix(1);
      }
      for (const char member : body) {
        if (member == '\\' || member == '[' || member == '^') {
          out += '\\';
        }
        out += member;
      }
      out += ']';
      i = close;
      break;
    }
    case ']':
      return Result<std::string>::failure(
          invalid_pattern(std::string(pattern), "unbalanced ']'"));
    case '.':
    case '+':
    case '^':
    case '$':
    case '(': case ')':
    case '{': case '}':
    case '|':
    case '\\':
      out += '\\';
      out += ch;
      break;
    default:
      out += ch;
      break;
    }
  }

  out += '$';
  return Result<std::string>::success(std::move(out));
}

GlobPattern::GlobPattern(std::string pattern, std::regex regex)
    : pattern_(std::move(pattern)), regex_(std::move(regex)) {}

Result<GlobPattern> GlobPattern::compile(const std::string &pattern) {
  auto translated = glob_to_regex(pattern);
  if (!translated.ok()) {
    return Result<GlobPattern>::failure(translated.error_info());
  }

  try {
    std::regex regex(translated.value(), std::regex::ECMAScript | std::regex::optimize);
    return Result<GlobPattern>::success(GlobPattern(pattern, std::move(regex)));
  } catch (const std::regex_error &ex) {
    return Result<GlobPattern>::failure(invalid_pattern(pattern, ex.what()));
  }
}

bool GlobPattern::matches(const std::string &path) const { return std::regex_match(path, regex_); }

bool glob_match(const std::string &path, const std::string &pattern) {
  auto compiled = GlobPattern::compile(pattern);
  if (!compiled.ok()) {
    return false;
  }
  return compiled.value().matches(path);
}

} // namespace fileweave::common
