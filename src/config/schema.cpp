#include "linkwatch/config/schema.hpp"

namespace linkwatch::config {

std::string_view refresh_interval_name(const RefreshInterval interval) {
  switch (interval) {
  case RefreshInterval::Off:
    return "off";
  case RefreshInterval::Sec30:
    return "30s";
  case RefreshInterval::Min1:
    return "1m";
  case RefreshInterval::Min2:
    return "2m";
  case RefreshInterval::Min5:
    return "5m";
  }
  return "off";
}

std::optional<RefreshInterval> parse_refresh_interval(const std::string_view text) {
  if (text == "off" || text == "0") {
    return RefreshInterval::Off;
  }
  if (text == "30s" || text == "30") {
    return RefreshInterval::Sec30;
  }
  if (text == "1m" || text == "60s" || text == "60") {
    return RefreshInterval::Min1;
  }
  if (text == "2m" || text == "120s" || text == "120") {
    return RefreshInterval::Min2;
  }
  if (text == "5m" || text == "300s" || text == "300") {
    return RefreshInterval::Min5;
  }
  return std::nullopt;
}

std::chrono::seconds refresh_interval_duration(const RefreshInterval interval) {
  switch (interval) {
  case RefreshInterval::Off:
    return std::chrono::seconds(0);
  case RefreshInterval::Sec30:
    return std::chrono::seconds(30);
  case RefreshInterval::Min1:
    return std::chrono::seconds(60);
  case RefreshInterval::Min2:
    return std::chrono::seconds(120);
  case RefreshInterval::Min5:
    return std::chrono::seconds(300);
  }
  return std::chrono::seconds(0);
}

const std::vector<std::string> &builtin_check_ids() {
  static const std::vector<std::string> ids = {
      "local_resources", "gpu",        "internet", "vpn",      "claude_api",
      "openai_api",      "google_api", "opencode", "terminals"};
  return ids;
}

} // namespace linkwatch::config
