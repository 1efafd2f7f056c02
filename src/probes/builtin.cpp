#include "linkwatch/probes/builtin.hpp"

#include "linkwatch/common/strings.hpp"
#include "linkwatch/probes/probes.hpp"

#include <set>

namespace linkwatch::probes {

namespace {

constexpr const char *ANTHROPIC_VERSION = "2023-06-01";

std::string join_url(const std::string &base, const std::string &path) {
  if (!base.empty() && base.back() == '/') {
    return base.substr(0, base.size() - 1) + path;
  }
  return base + path;
}

ApiEndpoint claude_endpoint(const config::ApiConfig &apis) {
  if (!apis.anthropic_key.has_value()) {
    return {.url = apis.claude_url, .headers = {}, .use_head = true};
  }
  return {.url = join_url(apis.claude_url, "/v1/models"),
          .headers = {{"x-api-key", *apis.anthropic_key},
                      {"anthropic-version", ANTHROPIC_VERSION}},
          .use_head = false};
}

ApiEndpoint openai_endpoint(const config::ApiConfig &apis) {
  ApiEndpoint endpoint{.url = apis.openai_url, .headers = {}, .use_head = false};
  if (apis.openai_key.has_value()) {
    endpoint.headers["Authorization"] = "Bearer " + *apis.openai_key;
  }
  return endpoint;
}

ApiEndpoint google_endpoint(const config::ApiConfig &apis) {
  ApiEndpoint endpoint{.url = apis.google_url, .headers = {}, .use_head = false};
  if (apis.gemini_key.has_value()) {
    endpoint.headers["x-goog-api-key"] = *apis.gemini_key;
  }
  return endpoint;
}

} // namespace

Collaborators make_system_collaborators() {
  Collaborators collaborators;
  collaborators.http = std::make_shared<CurlHttpClient>();
  collaborators.metrics = std::make_shared<ProcMetricSource>();
  collaborators.pinger = std::make_shared<HttpPinger>(collaborators.http);
  collaborators.processes = std::make_shared<ProcfsProcessSource>();
  collaborators.interfaces = std::make_shared<IfaddrsInterfaceSource>();
  collaborators.gpus = std::make_shared<SysfsGpuSource>();
  return collaborators;
}

std::vector<diag::RegisteredCheck> builtin_checks(const config::Settings &settings,
                                                  const Collaborators &collaborators) {
  const auto &thresholds = settings.thresholds;
  const auto &network = settings.network;
  using diag::Category;

  return {
      {{.id = "local_resources", .category = Category::System, .display_name = "LOCAL RESOURCES"},
       std::make_shared<SystemResourceProbe>(
           collaborators.metrics, ResourceThresholds{.cpu_warn = thresholds.cpu_warn,
                                                     .cpu_crit = thresholds.cpu_crit,
                                                     .ram_warn = thresholds.ram_warn,
                                                     .ram_crit = thresholds.ram_crit})},
      {{.id = "gpu", .category = Category::System, .display_name = "GPU"},
       std::make_shared<GpuProbe>(collaborators.gpus, thresholds.gpu_warn, thresholds.gpu_crit)},
      {{.id = "internet", .category = Category::Network, .display_name = "INTERNET"},
       std::make_shared<InternetProbe>(
           collaborators.pinger,
           InternetProbeOptions{.primary_host = network.primary_host,
                                .fallback_host = network.fallback_host,
                                .slow_threshold = std::chrono::milliseconds(network.slow_ms)})},
      {{.id = "vpn", .category = Category::Network, .display_name = "VPN"},
       std::make_shared<VpnProbe>(collaborators.interfaces, collaborators.pinger,
                                  VpnProbeOptions{.interface_prefixes = network.vpn_interfaces,
                                                  .reference_host = network.vpn_reference_host})},
      {{.id = "claude_api", .category = Category::ApiProvider, .display_name = "CLAUDE API"},
       std::make_shared<ApiProbe>("claude_api", collaborators.http,
                                  claude_endpoint(settings.apis))},
      {{.id = "openai_api", .category = Category::ApiProvider, .display_name = "OPENAI API"},
       std::make_shared<ApiProbe>("openai_api", collaborators.http,
                                  openai_endpoint(settings.apis))},
      {{.id = "google_api", .category = Category::ApiProvider, .display_name = "GOOGLE AI"},
       std::make_shared<ApiProbe>("google_api", collaborators.http,
                                  google_endpoint(settings.apis))},
      {{.id = "opencode",
        .category = Category::Process,
        .display_name = common::to_upper(settings.processes.client_name)},
       std::make_shared<ProcessProbe>(
           collaborators.processes,
           ProcessProbeOptions{.process_name = settings.processes.client_name,
                               .required = settings.processes.client_required,
                               .memory_limit_mb = thresholds.process_memory_mb})},
      {{.id = "terminals", .category = Category::Process, .display_name = "TERMINALS"},
       std::make_shared<TerminalProbe>(collaborators.processes, settings.processes.terminal_names,
                                       thresholds.terminal_sessions)},
  };
}

common::Status register_builtin_checks(diag::CheckRegistry &registry,
                                       const config::Settings &settings,
                                       const Collaborators &collaborators) {
  for (auto &check : builtin_checks(settings, collaborators)) {
    if (auto added = registry.add(std::move(check.definition), std::move(check.probe));
        !added.ok()) {
      return added;
    }
  }

  const std::set<diag::CheckId> enabled(settings.enabled_checks.begin(),
                                        settings.enabled_checks.end());
  return registry.apply_enabled_set(enabled);
}

common::Status install_builtin_checks(diag::DiagnosticsService &service,
                                      const config::Settings &settings,
                                      const Collaborators &collaborators) {
  if (auto registered = register_builtin_checks(service.registry(), settings, collaborators);
      !registered.ok()) {
    return registered;
  }
  service.set_probe_builder([collaborators](const config::Settings &updated) {
    return builtin_checks(updated, collaborators);
  });
  return common::Status::success();
}

} // namespace linkwatch::probes
