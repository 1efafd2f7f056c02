#pragma once

#include "linkwatch/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace linkwatch::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] std::string truncate(const std::string &value, std::size_t max_chars);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Formats a wall-clock instant as "YYYY-MM-DD HH:MM:SS" in UTC.
[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point time);
/// "HH:MM" in UTC.
[[nodiscard]] std::string format_utc_hhmm(std::chrono::system_clock::time_point time);

} // namespace linkwatch::common
