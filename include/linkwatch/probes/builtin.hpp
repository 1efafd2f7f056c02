#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/config/schema.hpp"
#include "linkwatch/diag/registry.hpp"
#include "linkwatch/diag/service.hpp"
#include "linkwatch/probes/http_client.hpp"
#include "linkwatch/probes/sources.hpp"

#include <memory>
#include <vector>

namespace linkwatch::probes {

/// Everything the built-in probes talk to. Tests substitute fakes.
struct Collaborators {
  std::shared_ptr<HttpClient> http;
  std::shared_ptr<MetricSource> metrics;
  std::shared_ptr<Pinger> pinger;
  std::shared_ptr<ProcessSource> processes;
  std::shared_ptr<InterfaceSource> interfaces;
  std::shared_ptr<GpuSource> gpus;
};

[[nodiscard]] Collaborators make_system_collaborators();

/// The built-in checks in display order, with probes configured from `settings`.
[[nodiscard]] std::vector<diag::RegisteredCheck> builtin_checks(const config::Settings &settings,
                                                                const Collaborators &collaborators);

/// Registers the built-in checks in display order and applies
/// `settings.enabled_checks`.
[[nodiscard]] common::Status register_builtin_checks(diag::CheckRegistry &registry,
                                                     const config::Settings &settings,
                                                     const Collaborators &collaborators);

/// Registers the built-in checks with the service and rebuilds their probes
/// whenever new settings are applied.
[[nodiscard]] common::Status install_builtin_checks(diag::DiagnosticsService &service,
                                                    const config::Settings &settings,
                                                    const Collaborators &collaborators);

} // namespace linkwatch::probes
