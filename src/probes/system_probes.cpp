#include "linkwatch/probes/probes.hpp"

#include <cmath>
#include <sstream>

namespace linkwatch::probes {

namespace {

std::string percent(const double value) {
  return std::to_string(static_cast<int>(std::lround(value))) + "%";
}

} // namespace

SystemResourceProbe::SystemResourceProbe(std::shared_ptr<MetricSource> source,
                                         ResourceThresholds thresholds)
    : source_(std::move(source)), thresholds_(thresholds) {}

diag::CheckResult SystemResourceProbe::execute(const std::chrono::milliseconds,
                                               const diag::CancellationToken &cancel) {
  const auto metrics = source_->read_system_metrics(cancel);
  if (!metrics.ok()) {
    if (metrics.kind() == common::ErrorKind::ProbeTimeout) {
      return diag::make_timeout_result(diag::Status::Unknown);
    }
    return diag::make_unavailable_result(metrics.error());
  }

  const auto &m = metrics.value();
  diag::DetailMap detail{{"CPU", percent(m.cpu_pct)},
                         {"RAM", percent(m.ram_pct)},
                         {"DISK", m.disk_state}};

  if (m.cpu_pct > thresholds_.cpu_crit || m.ram_pct > thresholds_.ram_crit) {
    return diag::make_result(diag::Status::Critical, "CRITICAL LOAD", std::move(detail));
  }
  if (m.cpu_pct > thresholds_.cpu_warn || m.ram_pct > thresholds_.ram_warn) {
    return diag::make_result(diag::Status::Warning, "HIGH LOAD", std::move(detail));
  }
  return diag::make_result(diag::Status::Ok, "NORMAL", std::move(detail));
}

GpuProbe::GpuProbe(std::shared_ptr<GpuSource> source, const double warn_pct, const double crit_pct)
    : source_(std::move(source)), warn_pct_(warn_pct), crit_pct_(crit_pct) {}

diag::CheckResult GpuProbe::execute(const std::chrono::milliseconds,
                                    const diag::CancellationToken &) {
  const auto gpus = source_->read_gpus();
  if (!gpus.ok()) {
    return diag::make_unavailable_result(gpus.error());
  }
  if (gpus.value().empty()) {
    return diag::make_result(diag::Status::Ok, "INACTIVE", {{"GPU", "none detected"}});
  }

  // The busiest card decides.
  const GpuInfo *busiest = nullptr;
  for (const auto &gpu : gpus.value()) {
    if (gpu.usage_pct.has_value() &&
        (busiest == nullptr || *gpu.usage_pct > *busiest->usage_pct)) {
      busiest = &gpu;
    }
  }
  if (busiest == nullptr) {
    return diag::make_result(diag::Status::Ok, "NO USAGE DATA",
                             {{"GPU", gpus.value().front().name}});
  }

  diag::DetailMap detail{{"GPU", busiest->name}, {"USAGE", percent(*busiest->usage_pct)}};
  if (busiest->memory_used_mb.has_value() && busiest->memory_total_mb.has_value()) {
    std::ostringstream vram;
    vram << *busiest->memory_used_mb << "/" << *busiest->memory_total_mb << "MB";
    detail.set("VRAM", vram.str());
  }

  if (*busiest->usage_pct > crit_pct_) {
    return diag::make_result(diag::Status::Critical, "OVERLOADED", std::move(detail));
  }
  if (*busiest->usage_pct > warn_pct_) {
    return diag::make_result(diag::Status::Warning, "HIGH LOAD", std::move(detail));
  }
  return diag::make_result(diag::Status::Ok, "NORMAL", std::move(detail));
}

} // namespace linkwatch::probes
