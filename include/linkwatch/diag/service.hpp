#pragma once

#include "linkwatch/common/result.hpp"
#include "linkwatch/config/schema.hpp"
#include "linkwatch/diag/error_log.hpp"
#include "linkwatch/diag/orchestrator.hpp"
#include "linkwatch/diag/pass_cell.hpp"
#include "linkwatch/diag/registry.hpp"
#include "linkwatch/diag/report.hpp"
#include "linkwatch/diag/scheduler.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace linkwatch::diag {

using PassListener = std::function<void(const std::shared_ptr<const DiagnosticPass> &)>;
/// Builds the probes for registered checks from a settings snapshot.
using ProbeBuilder = std::function<std::vector<RegisteredCheck>(const config::Settings &)>;

[[nodiscard]] OrchestratorOptions orchestrator_options(const config::Settings &settings);
/// The interval the scheduler should use: Off unless auto refresh is on.
[[nodiscard]] config::RefreshInterval effective_interval(const config::Settings &settings);

/// Owns the registry, orchestrator, error log, latest pass and scheduler.
/// Checks are registered through registry() before start().
class DiagnosticsService {
public:
  explicit DiagnosticsService(config::Settings settings = {});
  ~DiagnosticsService();

  DiagnosticsService(const DiagnosticsService &) = delete;
  DiagnosticsService &operator=(const DiagnosticsService &) = delete;

  [[nodiscard]] CheckRegistry &registry() { return registry_; }
  [[nodiscard]] const CheckRegistry &registry() const { return registry_; }

  void start();
  void stop();

  /// Asynchronous; preempts a pass already in flight.
  void run_now();
  /// Runs a pass on the calling thread. Null when a newer pass preempted it.
  [[nodiscard]] std::shared_ptr<const DiagnosticPass> run_blocking();

  [[nodiscard]] std::shared_ptr<const DiagnosticPass> current_pass() const;
  [[nodiscard]] std::uint64_t pass_version() const;
  [[nodiscard]] bool wait_for_pass(std::uint64_t seen, std::chrono::milliseconds timeout) const;
  [[nodiscard]] std::vector<ErrorLogEntry> error_log_entries() const;
  [[nodiscard]] std::string render_report(const DiagnosticPass &pass, bool include_log) const;

  void set_refresh_interval(config::RefreshInterval interval);
  [[nodiscard]] common::Status set_check_enabled(const CheckId &id, bool enabled);
  /// Validates first; on any error the previous settings stay active. With a
  /// probe builder installed, probes are rebuilt so thresholds, hosts and keys
  /// take effect on the next pass. A pass in flight keeps its old probes.
  [[nodiscard]] common::Status apply_settings(const config::Settings &settings);
  void set_probe_builder(ProbeBuilder builder);
  [[nodiscard]] config::Settings settings() const;

  void set_pass_listener(PassListener listener);
  [[nodiscard]] const Scheduler &scheduler() const { return scheduler_; }

private:
  void on_publish(const std::shared_ptr<const DiagnosticPass> &pass);

  mutable std::mutex settings_mutex_;
  config::Settings settings_;
  CheckRegistry registry_;
  Orchestrator orchestrator_;
  ErrorLog error_log_;
  PassCell latest_;
  std::mutex builder_mutex_;
  ProbeBuilder builder_;
  std::mutex listener_mutex_;
  PassListener listener_;
  Scheduler scheduler_;
};

} // namespace linkwatch::diag
