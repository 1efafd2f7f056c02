#pragma once

#include "linkwatch/common/result.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace linkwatch::common {

/// Flat view of a TOML file: "section.key" -> raw value text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

/// Emits sections and key/value lines in call order.
class TomlWriter {
public:
  void section(const std::string &name);
  void set(const std::string &key, const std::string &value);
  void set(const std::string &key, const char *value);
  void set(const std::string &key, bool value);
  void set(const std::string &key, std::uint64_t value);
  void set(const std::string &key, double value);
  void set(const std::string &key, const std::vector<std::string> &values);

  [[nodiscard]] std::string str() const { return out_.str(); }

private:
  std::ostringstream out_;
  bool has_content_ = false;
};

} // namespace linkwatch::common
