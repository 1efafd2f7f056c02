#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parses settings from TOML text. Missing keys keep their defaults; env
/// overrides are not applied.
[[nodiscard]] common::Result<Settings> parse_settings(const std::string &toml);
[[nodiscard]] std::string serialize_settings(const Settings &settings);

[[nodiscard]] common::Result<Settings> load_config();
[[nodiscard]] common::Status save_config(const Settings &settings);

/// Hard errors fail with ConfigurationError; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Settings &settings);
/// Same, checking enabled_checks against `known_check_ids` instead of the built-in ids.
[[nodiscard]] common::Result<std::vector<std::string>>
validate_config(const Settings &settings, const std::vector<std::string> &known_check_ids);

void apply_env_overrides(Settings &settings);

} // namespace linkwatch::config
