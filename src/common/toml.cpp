#include "fileweave/common/toml.hpp"

#include "fileweave/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace fileweave::common {

namespace {

// Calls visit(index, ch) for every character outside a quoted string until
// visit returns false. Returns the index where scanning stopped. Inside a
// basic string a backslash always consumes the next character, so "a\\"
// closes after the escaped backslash.
template <typename Visitor> std::size_t scan_unquoted(const std::string &text, Visitor visit) {
  char quote = '\0';
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (quote != '\0') {
      if (quote == '"' && ch == '\\') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      continue;
    }
    if (!visit(i, ch)) {
      return i;
    }
  }
  return text.size();
}

std::string strip_comment(const std::string &line) {
  return line.substr(0, scan_unquoted(line, [](std::size_t, char ch) { return ch != '#'; }));
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::size_t element_start = 0;
  scan_unquoted(array_value, [&](std::size_t i, char ch) {
    if (ch == ',') {
      result.push_back(trim(std::string_view(array_value).substr(element_start, i - element_start)));
      element_start = i + 1;
    }
    return true;
  });
  if (auto tail = trim(std::string_view(array_value).substr(element_start)); !tail.empty()) {
    result.push_back(std::move(tail));
  }
  return result;
}

bool brackets_open(const std::string &value) {
  long depth = 0;
  scan_unquoted(value, [&](std::size_t, char ch) {
    depth += ch == '[' ? 1 : (ch == ']' ? -1 : 0);
    return true;
  });
  return depth > 0;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

Error toml_error(const std::size_t line_number, const std::string &message) {
  return make_error(ErrorKind::InvalidConfig,
                    message + " at line " + std::to_string(line_number));
}

} // namespace

const std::string *TomlDocument::find(const std::string &key) const {
  const auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

bool TomlDocument::has(const std::string &key) const { return find(key) != nullptr; }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *raw = find(key);
  return raw == nullptr ? fallback : unquote(*raw);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *raw = find(key);
  if (raw == nullptr) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(*raw));
  return normalized == "true" ? true : (normalized == "false" ? false : fallback);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  return get_optional_u64(key).value_or(fallback);
}

// Underscores are accepted as digit separators ("16_777_216").
std::optional<std::uint64_t> TomlDocument::get_optional_u64(const std::string &key) const {
  const auto *raw = find(key);
  if (raw == nullptr) {
    return std::nullopt;
  }

  std::string digits = trim(*raw);
  digits.erase(std::remove(digits.begin(), digits.end(), '_'), digits.end());
  std::uint64_t parsed = 0;
  const auto *last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *raw = find(key);
  if (raw == nullptr) {
    return fallback;
  }
  const std::string array = trim(*raw);
  if (array.size() < 2 || array.front() != '[' || array.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(array.substr(1, array.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(toml_error(line_number, "Invalid empty section"));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(toml_error(line_number, "Invalid key/value"));
    }

    const std::string key = unquote(trim(clean_line.substr(0, equals_index)));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(toml_error(line_number, "Missing key"));
    }

    // Arrays may continue over several lines until the bracket closes.
    const std::size_t start_line = line_number;
    while (!value.empty() && value.front() == '[' && brackets_open(value)) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure(toml_error(start_line, "Unterminated array"));
      }
      ++line_number;
      value += ' ' + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure(
          toml_error(start_line, "Duplicate key '" + full_key + "'"));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
      escaped.push_back(ch);
    } else if (ch == '\n') {
      escaped += "\\n";
    } else if (ch == '\t') {
      escaped += "\\t";
    } else {
      escaped.push_back(ch);
    }
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

} // namespace fileweave::common
