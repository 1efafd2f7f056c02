#include "linkwatch/common/json_util.hpp"

#include <cctype>

namespace linkwatch::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// Returns the index of the closing quote, or npos.
std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

// Index one past the end of the value starting at `pos`, or npos.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char first = json[pos];
  if (first == '"') {
    const auto end = string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (first == '{' || first == '[') {
    std::size_t depth = 0;
    for (std::size_t i = pos; i < json.size(); ++i) {
      const char ch = json[i];
      if (ch == '"') {
        i = string_end(json, i);
        if (i == std::string::npos) {
          return i;
        }
        continue;
      }
      if (ch == '{' || ch == '[') {
        ++depth;
      } else if (ch == '}' || ch == ']') {
        --depth;
        if (depth == 0) {
          return i + 1;
        }
      }
    }
    return std::string::npos;
  }
  std::size_t i = pos;
  while (i < json.size() && json[i] != ',' && json[i] != '}' && json[i] != ']' &&
         std::isspace(static_cast<unsigned char>(json[i])) == 0) {
    ++i;
  }
  return i > pos ? i : std::string::npos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

JsonField json_field(const std::string &json, const std::string &field) {
  std::size_t pos = skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return {};
  }
  ++pos;

  while (true) {
    pos = skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != '"') {
      return {};
    }
    const auto key_end = string_end(json, pos);
    if (key_end == std::string::npos) {
      return {};
    }
    const std::string key = unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return {};
    }
    pos = skip_ws(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == std::string::npos) {
      return {};
    }

    if (key == field) {
      JsonField out;
      const char first = json[pos];
      if (first == '"') {
        out.kind = JsonKind::String;
        out.text = unescape(json.substr(pos + 1, end - pos - 2));
      } else if (first == '{') {
        out.kind = JsonKind::Object;
        out.text = json.substr(pos, end - pos);
      } else if (first == '[') {
        out.kind = JsonKind::Array;
        out.text = json.substr(pos, end - pos);
      } else {
        out.kind = JsonKind::Scalar;
        out.text = json.substr(pos, end - pos);
      }
      return out;
    }

    pos = skip_ws(json, end);
    if (pos >= json.size() || json[pos] != ',') {
      return {};
    }
    ++pos;
  }
}

} // namespace linkwatch::common
