#include "linkwatch/probes/probes.hpp"

#include "linkwatch/common/strings.hpp"

namespace linkwatch::probes {

namespace {

std::string millis(const std::chrono::milliseconds value) {
  return std::to_string(value.count()) + "ms";
}

} // namespace

InternetProbe::InternetProbe(std::shared_ptr<Pinger> pinger, InternetProbeOptions options)
    : pinger_(std::move(pinger)), options_(std::move(options)) {}

diag::CheckResult InternetProbe::execute(const std::chrono::milliseconds timeout,
                                         const diag::CancellationToken &cancel) {
  const auto started = std::chrono::steady_clock::now();
  const auto primary = pinger_->ping(options_.primary_host, timeout, cancel);
  if (primary.reachable) {
    diag::DetailMap detail{{"HOST", host_of(options_.primary_host)},
                           {"LATENCY", millis(primary.latency)}};
    if (primary.latency > options_.slow_threshold) {
      return diag::make_result(diag::Status::Warning, "SLOW", std::move(detail));
    }
    return diag::make_result(diag::Status::Ok, "ONLINE", std::move(detail));
  }
  if (primary.cancelled) {
    return diag::make_timeout_result(diag::Status::Critical);
  }

  // Both pings share one budget.
  const auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - started);
  if (remaining.count() <= 0) {
    auto result = diag::make_result(diag::Status::Critical, "OFFLINE",
                                    {{"HOST", host_of(options_.primary_host)},
                                     {"FALLBACK", "not tried"}});
    result.error = primary.error;
    return result;
  }

  const auto fallback = pinger_->ping(options_.fallback_host, remaining, cancel);
  if (fallback.reachable) {
    auto result = diag::make_result(diag::Status::Warning, "DEGRADED",
                                    {{"HOST", host_of(options_.fallback_host)},
                                     {"LATENCY", millis(fallback.latency)},
                                     {"PRIMARY", "unreachable"}});
    result.error = host_of(options_.primary_host) + ": " + primary.error;
    return result;
  }

  auto result = diag::make_result(diag::Status::Critical, "OFFLINE",
                                  {{"HOST", host_of(options_.primary_host)},
                                   {"FALLBACK", host_of(options_.fallback_host)}});
  result.error = primary.error;
  return result;
}

VpnProbe::VpnProbe(std::shared_ptr<InterfaceSource> interfaces, std::shared_ptr<Pinger> pinger,
                   VpnProbeOptions options)
    : interfaces_(std::move(interfaces)), pinger_(std::move(pinger)),
      options_(std::move(options)) {}

diag::CheckResult VpnProbe::execute(const std::chrono::milliseconds timeout,
                                    const diag::CancellationToken &cancel) {
  const auto listed = interfaces_->list_interfaces();
  if (!listed.ok()) {
    return diag::make_unavailable_result(listed.error());
  }

  std::vector<std::string> active;
  for (const auto &iface : listed.value()) {
    if (!iface.up) {
      continue;
    }
    const std::string lowered = common::to_lower(iface.name);
    for (const auto &prefix : options_.interface_prefixes) {
      if (common::starts_with(lowered, common::to_lower(prefix))) {
        active.push_back(iface.name);
        break;
      }
    }
  }

  if (active.empty()) {
    return diag::make_result(diag::Status::Ok, "INACTIVE");
  }

  diag::DetailMap detail{{"INTERFACE", common::join(active, ", ")},
                         {"REFERENCE", host_of(options_.reference_host)}};
  const auto reference = pinger_->ping(options_.reference_host, timeout, cancel);
  if (reference.reachable) {
    detail.set("LATENCY", millis(reference.latency));
    return diag::make_result(diag::Status::Ok, "ACTIVE", std::move(detail));
  }
  if (reference.cancelled) {
    // Presence is known but blocking cannot be confirmed.
    auto result = diag::make_result(diag::Status::Unknown, "ACTIVE", std::move(detail));
    result.error = "reference check cancelled";
    return result;
  }

  auto result = diag::make_result(diag::Status::Critical, "BLOCKING", std::move(detail));
  result.error = reference.error;
  return result;
}

} // namespace linkwatch::probes
