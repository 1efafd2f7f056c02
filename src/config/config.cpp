#include "linkwatch/config/config.hpp"

#include "linkwatch/common/strings.hpp"
#include "linkwatch/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace linkwatch::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".linkwatch";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LINKWATCH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> non_empty_env(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    const std::string trimmed = common::trim(value);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  return std::nullopt;
}

common::Status check_threshold_pair(const std::string &name, const double warn, const double crit) {
  if (warn < 0.0 || warn > 100.0 || crit < 0.0 || crit > 100.0) {
    return common::Status::error(common::ErrorKind::ConfigurationError,
                                 "thresholds." + name + " must be between 0 and 100");
  }
  if (warn > crit) {
    return common::Status::error(common::ErrorKind::ConfigurationError,
                                 "thresholds." + name + "_warn must not exceed " + name + "_crit");
  }
  return common::Status::success();
}

bool looks_like_url(const std::string &value) {
  return common::starts_with(value, "https://") || common::starts_with(value, "http://");
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(common::ErrorKind::IoError,
                                                              "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Settings &settings) {
  if (const auto refresh = non_empty_env("LINKWATCH_REFRESH"); refresh.has_value()) {
    if (const auto parsed = parse_refresh_interval(common::to_lower(*refresh));
        parsed.has_value()) {
      settings.refresh_interval = *parsed;
    }
  }

  if (const auto timeout = non_empty_env("LINKWATCH_PROBE_TIMEOUT_MS"); timeout.has_value()) {
    std::uint64_t parsed = 0;
    const auto *first = timeout->data();
    const auto *last = first + timeout->size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last && parsed > 0) {
      settings.timeouts.probe_ms = parsed;
    }
  }

  if (auto key = non_empty_env("ANTHROPIC_API_KEY"); key.has_value()) {
    settings.apis.anthropic_key = std::move(key);
  }
  if (auto key = non_empty_env("OPENAI_API_KEY"); key.has_value()) {
    settings.apis.openai_key = std::move(key);
  }
  if (auto key = non_empty_env("GEMINI_API_KEY"); key.has_value()) {
    settings.apis.gemini_key = std::move(key);
  }
}

common::Result<Settings> parse_settings(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Settings>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Settings settings;
  settings.enabled_checks = doc.get_string_array("enabled_checks", settings.enabled_checks);
  if (doc.has("refresh_interval")) {
    const std::string raw = common::to_lower(common::trim(doc.get_string("refresh_interval")));
    const auto interval = parse_refresh_interval(raw);
    if (!interval.has_value()) {
      return common::Result<Settings>::failure(common::ErrorKind::ConfigurationError,
                                               "Invalid refresh_interval: " + raw);
    }
    settings.refresh_interval = *interval;
  }
  settings.auto_refresh = doc.get_bool("auto_refresh", settings.auto_refresh);
  settings.theme = doc.get_string("theme", settings.theme);

  auto &timeouts = settings.timeouts;
  timeouts.probe_ms = doc.get_u64("timeouts.probe_ms", timeouts.probe_ms);
  // The run deadline follows the probe timeout unless set explicitly.
  timeouts.run_deadline_ms = doc.get_u64("timeouts.run_deadline_ms", timeouts.probe_ms * 3);
  timeouts.cancel_grace_ms = doc.get_u64("timeouts.cancel_grace_ms", timeouts.cancel_grace_ms);

  auto &thresholds = settings.thresholds;
  thresholds.cpu_warn = doc.get_double("thresholds.cpu_warn", thresholds.cpu_warn);
  thresholds.cpu_crit = doc.get_double("thresholds.cpu_crit", thresholds.cpu_crit);
  thresholds.ram_warn = doc.get_double("thresholds.ram_warn", thresholds.ram_warn);
  thresholds.ram_crit = doc.get_double("thresholds.ram_crit", thresholds.ram_crit);
  thresholds.gpu_warn = doc.get_double("thresholds.gpu_warn", thresholds.gpu_warn);
  thresholds.gpu_crit = doc.get_double("thresholds.gpu_crit", thresholds.gpu_crit);
  thresholds.process_memory_mb =
      doc.get_u64("thresholds.process_memory_mb", thresholds.process_memory_mb);
  thresholds.terminal_sessions =
      doc.get_u64("thresholds.terminal_sessions", thresholds.terminal_sessions);

  auto &network = settings.network;
  network.primary_host = doc.get_string("network.primary_host", network.primary_host);
  network.fallback_host = doc.get_string("network.fallback_host", network.fallback_host);
  network.slow_ms = doc.get_u64("network.slow_ms", network.slow_ms);
  network.vpn_interfaces = doc.get_string_array("network.vpn_interfaces", network.vpn_interfaces);
  network.vpn_reference_host =
      doc.get_string("network.vpn_reference_host", network.vpn_reference_host);

  auto &apis = settings.apis;
  apis.claude_url = doc.get_string("apis.claude_url", apis.claude_url);
  apis.openai_url = doc.get_string("apis.openai_url", apis.openai_url);
  apis.google_url = doc.get_string("apis.google_url", apis.google_url);

  auto &processes = settings.processes;
  processes.client_name = doc.get_string("processes.client_name", processes.client_name);
  processes.client_required = doc.get_bool("processes.client_required", processes.client_required);
  processes.terminal_names =
      doc.get_string_array("processes.terminal_names", processes.terminal_names);

  settings.observability.backend =
      doc.get_string("observability.backend", settings.observability.backend);
  settings.observability.file_path =
      doc.get_string("observability.file_path", settings.observability.file_path);

  return common::Result<Settings>::success(std::move(settings));
}

std::string serialize_settings(const Settings &settings) {
  common::TomlWriter writer;
  writer.set("enabled_checks", settings.enabled_checks);
  writer.set("refresh_interval", std::string(refresh_interval_name(settings.refresh_interval)));
  writer.set("auto_refresh", settings.auto_refresh);
  writer.set("theme", settings.theme);

  writer.section("timeouts");
  writer.set("probe_ms", settings.timeouts.probe_ms);
  writer.set("run_deadline_ms", settings.timeouts.run_deadline_ms);
  writer.set("cancel_grace_ms", settings.timeouts.cancel_grace_ms);

  writer.section("thresholds");
  writer.set("cpu_warn", settings.thresholds.cpu_warn);
  writer.set("cpu_crit", settings.thresholds.cpu_crit);
  writer.set("ram_warn", settings.thresholds.ram_warn);
  writer.set("ram_crit", settings.thresholds.ram_crit);
  writer.set("gpu_warn", settings.thresholds.gpu_warn);
  writer.set("gpu_crit", settings.thresholds.gpu_crit);
  writer.set("process_memory_mb", settings.thresholds.process_memory_mb);
  writer.set("terminal_sessions", settings.thresholds.terminal_sessions);

  writer.section("network");
  writer.set("primary_host", settings.network.primary_host);
  writer.set("fallback_host", settings.network.fallback_host);
  writer.set("slow_ms", settings.network.slow_ms);
  writer.set("vpn_interfaces", settings.network.vpn_interfaces);
  writer.set("vpn_reference_host", settings.network.vpn_reference_host);

  writer.section("apis");
  writer.set("claude_url", settings.apis.claude_url);
  writer.set("openai_url", settings.apis.openai_url);
  writer.set("google_url", settings.apis.google_url);

  writer.section("processes");
  writer.set("client_name", settings.processes.client_name);
  writer.set("client_required", settings.processes.client_required);
  writer.set("terminal_names", settings.processes.terminal_names);

  writer.section("observability");
  writer.set("backend", settings.observability.backend);
  writer.set("file_path", settings.observability.file_path);
  return writer.str();
}

common::Result<Settings> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Settings>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Settings settings;
    apply_env_overrides(settings);
    return common::Result<Settings>::success(std::move(settings));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Settings>::failure(common::ErrorKind::IoError,
                                             "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_settings(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Settings>::failure(parsed.kind(),
                                             path.string() + ": " + parsed.error());
  }

  Settings settings = std::move(parsed.value());
  apply_env_overrides(settings);
  return common::Result<Settings>::success(std::move(settings));
}

common::Status save_config(const Settings &settings) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorKind::IoError,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "Unable to write temporary config file");
  }
  file << serialize_settings(settings);
  file.close();
  if (!file) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::IoError,
                                 "Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Settings &settings) {
  return validate_config(settings, builtin_check_ids());
}

common::Result<std::vector<std::string>> validate_config(const Settings &settings,
                                                         const std::vector<std::string> &known) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  for (const auto &id : settings.enabled_checks) {
    if (std::find(known.begin(), known.end(), id) == known.end()) {
      return Warnings::failure(common::ErrorKind::ConfigurationError,
                               "Unknown check id in enabled_checks: " + id);
    }
  }
  if (settings.enabled_checks.empty()) {
    warnings.push_back("enabled_checks is empty; passes will report UNKNOWN");
  }

  if (settings.timeouts.probe_ms == 0) {
    return Warnings::failure(common::ErrorKind::ConfigurationError,
                             "timeouts.probe_ms must be > 0");
  }
  if (settings.timeouts.run_deadline_ms == 0) {
    return Warnings::failure(common::ErrorKind::ConfigurationError,
                             "timeouts.run_deadline_ms must be > 0");
  }
  if (settings.timeouts.run_deadline_ms < settings.timeouts.probe_ms) {
    warnings.push_back("timeouts.run_deadline_ms is shorter than timeouts.probe_ms");
  }

  const auto &thresholds = settings.thresholds;
  for (const auto &status : {check_threshold_pair("cpu", thresholds.cpu_warn, thresholds.cpu_crit),
                             check_threshold_pair("ram", thresholds.ram_warn, thresholds.ram_crit),
                             check_threshold_pair("gpu", thresholds.gpu_warn, thresholds.gpu_crit)}) {
    if (!status.ok()) {
      return Warnings::failure(status);
    }
  }
  if (thresholds.terminal_sessions == 0) {
    warnings.push_back("thresholds.terminal_sessions is 0; any terminal counts as many sessions");
  }

  for (const auto &[name, value] :
       {std::pair<std::string, std::string>{"network.primary_host", settings.network.primary_host},
        {"network.fallback_host", settings.network.fallback_host},
        {"network.vpn_reference_host", settings.network.vpn_reference_host},
        {"apis.claude_url", settings.apis.claude_url},
        {"apis.openai_url", settings.apis.openai_url},
        {"apis.google_url", settings.apis.google_url}}) {
    if (!looks_like_url(value)) {
      return Warnings::failure(common::ErrorKind::ConfigurationError,
                               name + " must be an http(s) URL: " + value);
    }
  }

  if (common::trim(settings.processes.client_name).empty()) {
    return Warnings::failure(common::ErrorKind::ConfigurationError,
                             "processes.client_name is required");
  }

  const std::string backend = common::to_lower(common::trim(settings.observability.backend));
  for (const auto &part : common::split(backend, ',')) {
    if (part == "file" && common::trim(settings.observability.file_path).empty()) {
      return Warnings::failure(common::ErrorKind::ConfigurationError,
                               "observability.file_path is required for the file backend");
    }
    if (part != "none" && part != "log" && part != "file") {
      warnings.push_back("Unknown observability.backend '" + part + "', falling back to log");
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace linkwatch::config
