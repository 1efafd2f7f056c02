#include "linkwatch/common/toml.hpp"

#include "linkwatch/common/strings.hpp"

#include <charconv>

namespace linkwatch::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (escaped) {
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

bool is_balanced_array(const std::string &value) {
  return !value.empty() && value.front() == '[' && value.back() == ']';
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::size_t consumed = 0;
  try {
    const double parsed = std::stod(normalized, &consumed);
    return consumed == normalized.size() ? parsed : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (!is_balanced_array(raw)) {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']' && clean_line.find('=') == std::string::npos) {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(ErrorKind::ConfigurationError,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::ConfigurationError,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::ConfigurationError,
                                           "Missing key at line " + std::to_string(line_number));
    }

    // Arrays may span several lines.
    if (!value.empty() && value.front() == '[') {
      while (!is_balanced_array(value) && std::getline(stream, line)) {
        ++line_number;
        value += " " + trim(strip_comment(line));
        value = trim(value);
      }
      if (!is_balanced_array(value)) {
        return Result<TomlDocument>::failure(ErrorKind::ConfigurationError,
                                             "Unterminated array for key '" + key + "'");
      }
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure(ErrorKind::ConfigurationError,
                                           "Duplicate key '" + full_key + "' at line " +
                                               std::to_string(line_number));
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
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

void TomlWriter::section(const std::string &name) {
  if (has_content_) {
    out_ << "\n";
  }
  out_ << "[" << name << "]\n";
  has_content_ = true;
}

void TomlWriter::set(const std::string &key, const std::string &value) {
  out_ << key << " = " << quote_toml_string(value) << "\n";
  has_content_ = true;
}

void TomlWriter::set(const std::string &key, const char *value) { set(key, std::string(value)); }

void TomlWriter::set(const std::string &key, const bool value) {
  out_ << key << " = " << (value ? "true" : "false") << "\n";
  has_content_ = true;
}

void TomlWriter::set(const std::string &key, const std::uint64_t value) {
  out_ << key << " = " << value << "\n";
  has_content_ = true;
}

void TomlWriter::set(const std::string &key, const double value) {
  out_ << key << " = " << value << "\n";
  has_content_ = true;
}

void TomlWriter::set(const std::string &key, const std::vector<std::string> &values) {
  out_ << key << " = [";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out_ << ", ";
    }
    out_ << quote_toml_string(values[i]);
  }
  out_ << "]\n";
  has_content_ = true;
}

} // namespace linkwatch::common
