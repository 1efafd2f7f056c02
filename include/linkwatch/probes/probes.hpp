#pragma once

#include "linkwatch/diag/probe.hpp"
#include "linkwatch/probes/http_client.hpp"
#include "linkwatch/probes/sources.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace linkwatch::probes {

struct ResourceThresholds {
  double cpu_warn = 70.0;
  double cpu_crit = 90.0;
  double ram_warn = 85.0;
  double ram_crit = 95.0;
};

class SystemResourceProbe final : public diag::Probe {
public:
  SystemResourceProbe(std::shared_ptr<MetricSource> source, ResourceThresholds thresholds = {});

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "local_resources"; }

private:
  std::shared_ptr<MetricSource> source_;
  ResourceThresholds thresholds_;
};

class GpuProbe final : public diag::Probe {
public:
  GpuProbe(std::shared_ptr<GpuSource> source, double warn_pct = 80.0, double crit_pct = 95.0);

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "gpu"; }

private:
  std::shared_ptr<GpuSource> source_;
  double warn_pct_;
  double crit_pct_;
};

struct InternetProbeOptions {
  std::string primary_host = "https://www.google.com";
  std::string fallback_host = "https://1.1.1.1";
  std::chrono::milliseconds slow_threshold{2000};
};

/// ONLINE, SLOW, DEGRADED (fallback host only) or OFFLINE.
class InternetProbe final : public diag::Probe {
public:
  InternetProbe(std::shared_ptr<Pinger> pinger, InternetProbeOptions options = {});

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "internet"; }

private:
  std::shared_ptr<Pinger> pinger_;
  InternetProbeOptions options_;
};

struct VpnProbeOptions {
  std::vector<std::string> interface_prefixes = {"tun", "wg", "ppp", "tap", "utun", "ipsec"};
  std::string reference_host = "https://api.anthropic.com";
};

/// No VPN is not a problem. An active VPN only escalates when the reference
/// host is confirmed unreachable through it.
class VpnProbe final : public diag::Probe {
public:
  VpnProbe(std::shared_ptr<InterfaceSource> interfaces, std::shared_ptr<Pinger> pinger,
           VpnProbeOptions options = {});

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "vpn"; }

private:
  std::shared_ptr<InterfaceSource> interfaces_;
  std::shared_ptr<Pinger> pinger_;
  VpnProbeOptions options_;
};

struct ApiEndpoint {
  std::string url;
  HttpHeaders headers;
  bool use_head = false;
};

/// Error text from a JSON error body: error.message, error, or message.
[[nodiscard]] std::optional<std::string> extract_error_message(const std::string &body);

/// Maps one HTTP exchange onto a check result. Only the status code class is
/// interpreted; everything else is passed through as detail.
[[nodiscard]] diag::CheckResult map_api_response(const HttpResponse &response,
                                                 const std::string &host);

[[nodiscard]] std::string host_of(const std::string &url);

class ApiProbe final : public diag::Probe {
public:
  ApiProbe(std::string probe_name, std::shared_ptr<HttpClient> client, ApiEndpoint endpoint);

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return probe_name_; }

private:
  std::string probe_name_;
  std::shared_ptr<HttpClient> client_;
  ApiEndpoint endpoint_;
};

struct ProcessProbeOptions {
  std::string process_name = "opencode";
  bool required = false;
  std::uint64_t memory_limit_mb = 2000;
};

class ProcessProbe final : public diag::Probe {
public:
  ProcessProbe(std::shared_ptr<ProcessSource> source, ProcessProbeOptions options = {});

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "process"; }

private:
  std::shared_ptr<ProcessSource> source_;
  ProcessProbeOptions options_;
};

class TerminalProbe final : public diag::Probe {
public:
  TerminalProbe(std::shared_ptr<ProcessSource> source, std::vector<std::string> terminal_names,
                std::uint64_t max_sessions = 10);

  [[nodiscard]] diag::CheckResult execute(std::chrono::milliseconds timeout,
                                          const diag::CancellationToken &cancel) override;
  [[nodiscard]] std::string_view name() const override { return "terminals"; }

private:
  std::shared_ptr<ProcessSource> source_;
  std::vector<std::string> terminal_names_;
  std::uint64_t max_sessions_;
};

} // namespace linkwatch::probes
