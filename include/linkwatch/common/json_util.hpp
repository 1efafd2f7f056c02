#pragma once

#include <string>

namespace linkwatch::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

enum class JsonKind {
  Missing,
  String,
  Object,
  Array,
  Scalar,
};

/// A top-level member of a JSON object. For strings `text` is the unescaped
/// value; for everything else it is the raw token including brackets.
struct JsonField {
  JsonKind kind = JsonKind::Missing;
  std::string text;
};

/// Looks up `field` among the top-level members of the object in `json`.
/// Malformed input yields a Missing field rather than an error.
[[nodiscard]] JsonField json_field(const std::string &json, const std::string &field);

} // namespace linkwatch::common
