#include "linkwatch/probes/probes.hpp"

#include "linkwatch/common/strings.hpp"

namespace linkwatch::probes {

namespace {

constexpr std::uint64_t BYTES_PER_MB = 1024 * 1024;

} // namespace

ProcessProbe::ProcessProbe(std::shared_ptr<ProcessSource> source, ProcessProbeOptions options)
    : source_(std::move(source)), options_(std::move(options)) {}

diag::CheckResult ProcessProbe::execute(const std::chrono::milliseconds,
                                        const diag::CancellationToken &) {
  const auto processes = source_->list_processes();
  if (!processes.ok()) {
    return diag::make_unavailable_result(processes.error());
  }

  const auto matches = find_processes(processes.value(), options_.process_name);
  if (matches.empty()) {
    if (options_.required) {
      return diag::make_result(diag::Status::Critical, "NOT RUNNING",
                               {{"PROCESS", options_.process_name}});
    }
    return diag::make_result(diag::Status::Ok, "INACTIVE", {{"PROCESS", options_.process_name}});
  }

  std::uint64_t total_bytes = 0;
  for (const auto &process : matches) {
    total_bytes += process.memory_bytes;
  }
  const std::uint64_t total_mb = total_bytes / BYTES_PER_MB;

  diag::DetailMap detail{{"PID", std::to_string(matches.front().pid)},
                         {"MEMORY", std::to_string(total_mb) + "MB"}};
  if (matches.size() > 1) {
    detail.set("INSTANCES", std::to_string(matches.size()));
  }

  if (total_mb > options_.memory_limit_mb) {
    return diag::make_result(diag::Status::Warning, "HIGH MEMORY", std::move(detail));
  }
  return diag::make_result(diag::Status::Ok, "RUNNING", std::move(detail));
}

TerminalProbe::TerminalProbe(std::shared_ptr<ProcessSource> source,
                             std::vector<std::string> terminal_names,
                             const std::uint64_t max_sessions)
    : source_(std::move(source)), terminal_names_(std::move(terminal_names)),
      max_sessions_(max_sessions) {}

diag::CheckResult TerminalProbe::execute(const std::chrono::milliseconds,
                                         const diag::CancellationToken &) {
  const auto processes = source_->list_processes();
  if (!processes.ok()) {
    return diag::make_unavailable_result(processes.error());
  }

  std::uint64_t sessions = 0;
  std::vector<std::string> kinds;
  for (const auto &name : terminal_names_) {
    const auto matches = find_processes(processes.value(), name);
    if (!matches.empty()) {
      sessions += matches.size();
      kinds.push_back(name);
    }
  }

  if (sessions == 0) {
    return diag::make_result(diag::Status::Ok, "INACTIVE");
  }

  diag::DetailMap detail{{"SESSIONS", std::to_string(sessions)},
                         {"TERMINALS", common::join(kinds, ", ")}};
  if (sessions > max_sessions_) {
    return diag::make_result(diag::Status::Warning, "MANY SESSIONS", std::move(detail));
  }
  return diag::make_result(diag::Status::Ok, "RUNNING", std::move(detail));
}

} // namespace linkwatch::probes
