#include "linkwatch/diag/report.hpp"

#include "linkwatch/common/strings.hpp"

#include <sstream>

namespace linkwatch::diag {

namespace {

std::string label_for(const CheckResult &result) {
  return result.display_name.empty() ? common::to_upper(result.check_id) : result.display_name;
}

std::string detail_line(const DetailMap &detail) {
  std::vector<std::string> parts;
  parts.reserve(detail.size());
  for (const auto &[key, value] : detail.entries()) {
    parts.push_back(key + ": " + value);
  }
  return common::join(parts, " :: ");
}

std::string recent_times(const ErrorLogEntry &entry) {
  std::vector<std::string> times;
  times.reserve(entry.recent.size());
  for (const auto &time : entry.recent) {
    times.push_back(common::format_utc_hhmm(time));
  }
  return common::join(times, ", ");
}

} // namespace

std::string_view status_glyph(const Status status) {
  switch (status) {
  case Status::Ok:
    return "[OK]";
  case Status::Unknown:
    return "[??]";
  case Status::Warning:
    return "[!!]";
  case Status::Critical:
    return "[XX]";
  }
  return "[??]";
}

std::string diagnosis(const DiagnosticPass &pass) {
  if (pass.results.empty()) {
    return "No checks enabled.";
  }

  const CheckResult *worst = nullptr;
  for (const auto &result : pass.results) {
    if (result.status == Status::Ok) {
      continue;
    }
    if (worst == nullptr || static_cast<int>(result.status) > static_cast<int>(worst->status)) {
      worst = &result;
    }
  }
  if (worst == nullptr) {
    return "All systems operational.";
  }
  return label_for(*worst) + ": " + worst->headline;
}

std::string render_report(const DiagnosticPass &pass, const std::vector<ErrorLogEntry> *error_log,
                          const ReportOptions &options) {
  std::ostringstream out;
  out << "=== " << options.title << " ===\n";
  out << "Pass: " << pass.pass_id << "\n";
  out << "Time: " << common::format_utc(pass.finished_at) << " UTC\n";
  out << "Overall: " << status_name(pass.overall_status) << "\n";
  out << "\n";

  for (const auto &result : pass.results) {
    out << status_glyph(result.status) << " " << label_for(result) << " :: " << result.headline;
    if (options.show_latency) {
      out << " (" << result.latency.count() << "ms)";
    }
    out << "\n";
    if (!result.detail.empty()) {
      out << "     " << detail_line(result.detail) << "\n";
    }
    if (result.error.has_value()) {
      out << "     Error: " << *result.error << "\n";
    }
  }

  if (error_log != nullptr && !error_log->empty()) {
    out << "\nERROR LOG\n";
    for (const auto &entry : *error_log) {
      const std::string name =
          entry.display_name.empty() ? common::to_upper(entry.check_id) : entry.display_name;
      out << "  " << status_glyph(entry.status) << " " << name << ": " << entry.last_message
          << " (x" << entry.occurrence_count << ", since "
          << common::format_utc(entry.first_seen) << " UTC; recent " << recent_times(entry)
          << ")\n";
    }
  }

  out << "\nDIAGNOSIS: " << diagnosis(pass) << "\n";
  return out.str();
}

} // namespace linkwatch::diag
