#include "linkwatch/diag/service.hpp"

#include "linkwatch/config/config.hpp"
#include "linkwatch/observability/global.hpp"

#include <set>

namespace linkwatch::diag {

OrchestratorOptions orchestrator_options(const config::Settings &settings) {
  return {.probe_timeout = std::chrono::milliseconds(settings.timeouts.probe_ms),
          .run_deadline = std::chrono::milliseconds(settings.timeouts.run_deadline_ms),
          .cancel_grace = std::chrono::milliseconds(settings.timeouts.cancel_grace_ms)};
}

config::RefreshInterval effective_interval(const config::Settings &settings) {
  return settings.auto_refresh ? settings.refresh_interval : config::RefreshInterval::Off;
}

DiagnosticsService::DiagnosticsService(config::Settings settings)
    : settings_(std::move(settings)), orchestrator_(orchestrator_options(settings_)),
      scheduler_([this](const CancellationToken &token) {
                   (void)orchestrator_.run(registry_.list_enabled(), token);
                 },
                 [this]() { orchestrator_.cancel_active(); },
                 effective_interval(settings_)) {
  orchestrator_.set_publish_callback(
      [this](const std::shared_ptr<const DiagnosticPass> &pass) { on_publish(pass); });
}

DiagnosticsService::~DiagnosticsService() { stop(); }

void DiagnosticsService::start() { scheduler_.start(); }

void DiagnosticsService::stop() { scheduler_.stop(); }

void DiagnosticsService::run_now() {
  scheduler_.start();
  scheduler_.run_now();
}

std::shared_ptr<const DiagnosticPass> DiagnosticsService::run_blocking() {
  return orchestrator_.run(registry_.list_enabled());
}

void DiagnosticsService::on_publish(const std::shared_ptr<const DiagnosticPass> &pass) {
  error_log_.apply(*pass);
  latest_.store(pass);
  observability::record_metric(
      observability::ErrorLogSizeMetric{.entries = static_cast<std::uint64_t>(error_log_.size())});

  PassListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(pass);
  }
}

std::shared_ptr<const DiagnosticPass> DiagnosticsService::current_pass() const {
  return latest_.load();
}

std::uint64_t DiagnosticsService::pass_version() const { return latest_.version(); }

bool DiagnosticsService::wait_for_pass(const std::uint64_t seen,
                                       const std::chrono::milliseconds timeout) const {
  return latest_.wait_for_version(seen, timeout);
}

std::vector<ErrorLogEntry> DiagnosticsService::error_log_entries() const {
  return error_log_.entries();
}

std::string DiagnosticsService::render_report(const DiagnosticPass &pass,
                                              const bool include_log) const {
  if (!include_log) {
    return diag::render_report(pass);
  }
  const auto entries = error_log_.entries();
  return diag::render_report(pass, &entries);
}

void DiagnosticsService::set_refresh_interval(const config::RefreshInterval interval) {
  config::Settings snapshot;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_.refresh_interval = interval;
    settings_.auto_refresh = interval != config::RefreshInterval::Off;
    snapshot = settings_;
  }
  scheduler_.set_interval(effective_interval(snapshot));
}

common::Status DiagnosticsService::set_check_enabled(const CheckId &id, const bool enabled) {
  auto status = registry_.set_enabled(id, enabled);
  if (!status.ok()) {
    return status;
  }
  const auto ids = registry_.enabled_ids();
  std::lock_guard<std::mutex> lock(settings_mutex_);
  settings_.enabled_checks.clear();
  for (const auto &definition : registry_.list_all()) {
    if (ids.contains(definition.id)) {
      settings_.enabled_checks.push_back(definition.id);
    }
  }
  return common::Status::success();
}

common::Status DiagnosticsService::apply_settings(const config::Settings &settings) {
  std::vector<std::string> known;
  for (const auto &definition : registry_.list_all()) {
    known.push_back(definition.id);
  }
  const auto validated = config::validate_config(settings, known);
  if (!validated.ok()) {
    observability::record_error("settings", validated.error());
    return validated.status();
  }
  for (const auto &warning : validated.value()) {
    observability::record_error("settings", "warning: " + warning);
  }

  ProbeBuilder builder;
  {
    std::lock_guard<std::mutex> lock(builder_mutex_);
    builder = builder_;
  }
  if (builder) {
    if (auto replaced = registry_.replace_probes(builder(settings)); !replaced.ok()) {
      observability::record_error("settings", replaced.error());
      return replaced;
    }
  }

  const std::set<CheckId> enabled(settings.enabled_checks.begin(), settings.enabled_checks.end());
  if (auto applied = registry_.apply_enabled_set(enabled); !applied.ok()) {
    observability::record_error("settings", applied.error());
    return applied;
  }

  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_ = settings;
  }
  orchestrator_.set_options(orchestrator_options(settings));
  scheduler_.set_interval(effective_interval(settings));
  return common::Status::success();
}

config::Settings DiagnosticsService::settings() const {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  return settings_;
}

void DiagnosticsService::set_probe_builder(ProbeBuilder builder) {
  std::lock_guard<std::mutex> lock(builder_mutex_);
  builder_ = std::move(builder);
}

void DiagnosticsService::set_pass_listener(PassListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

} // namespace linkwatch::diag
