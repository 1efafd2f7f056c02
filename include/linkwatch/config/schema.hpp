#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linkwatch::config {

enum class RefreshInterval {
  Off,
  Sec30,
  Min1,
  Min2,
  Min5,
};

/// "off", "30s", "1m", "2m", "5m".
[[nodiscard]] std::string_view refresh_interval_name(RefreshInterval interval);
[[nodiscard]] std::optional<RefreshInterval> parse_refresh_interval(std::string_view text);
/// Zero for Off.
[[nodiscard]] std::chrono::seconds refresh_interval_duration(RefreshInterval interval);

struct TimeoutConfig {
  std::uint64_t probe_ms = 5000;
  std::uint64_t run_deadline_ms = 15000;
  std::uint64_t cancel_grace_ms = 250;
};

struct ThresholdConfig {
  double cpu_warn = 70.0;
  double cpu_crit = 90.0;
  double ram_warn = 85.0;
  double ram_crit = 95.0;
  double gpu_warn = 80.0;
  double gpu_crit = 95.0;
  std::uint64_t process_memory_mb = 2000;
  std::uint64_t terminal_sessions = 10;
};

struct NetworkConfig {
  std::string primary_host = "https://www.google.com";
  std::string fallback_host = "https://1.1.1.1";
  std::uint64_t slow_ms = 2000;
  std::vector<std::string> vpn_interfaces = {"tun", "wg", "ppp", "tap", "utun", "ipsec"};
  std::string vpn_reference_host = "https://api.anthropic.com";
};

struct ApiConfig {
  std::string claude_url = "https://api.anthropic.com";
  std::string openai_url = "https://api.openai.com/v1/models";
  std::string google_url = "https://generativelanguage.googleapis.com/v1beta/models";
  // Taken from the environment only; never written to disk.
  std::optional<std::string> anthropic_key;
  std::optional<std::string> openai_key;
  std::optional<std::string> gemini_key;
};

struct ProcessConfig {
  std::string client_name = "opencode";
  bool client_required = false;
  std::vector<std::string> terminal_names = {"gnome-terminal", "konsole", "alacritty", "kitty",
                                             "xterm",          "wezterm", "tmux"};
};

struct ObservabilityConfig {
  /// Comma list of "log" and "file", or "none".
  std::string backend = "log";
  /// Used by the "file" backend; `~` is expanded.
  std::string file_path = "~/.linkwatch/history.log";
};

struct Settings {
  std::vector<std::string> enabled_checks = {"local_resources", "internet", "claude_api",
                                             "opencode"};
  RefreshInterval refresh_interval = RefreshInterval::Min1;
  bool auto_refresh = false;
  std::string theme = "dark";

  TimeoutConfig timeouts;
  ThresholdConfig thresholds;
  NetworkConfig network;
  ApiConfig apis;
  ProcessConfig processes;
  ObservabilityConfig observability;
};

/// Ids of the checks the default registry knows about, in registration order.
[[nodiscard]] const std::vector<std::string> &builtin_check_ids();

} // namespace linkwatch::config
