#include "linkwatch/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace linkwatch::observability {

LogLine format_event(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> LogLine {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PassStartEvent>) {
          return {"INFO", "pass.start id=" + std::to_string(evt.pass_id) +
                              " checks=" + std::to_string(evt.checks)};
        } else if constexpr (std::is_same_v<T, PassEndEvent>) {
          return {"INFO", "pass.end id=" + std::to_string(evt.pass_id) +
                              " overall=" + evt.overall_status +
                              " duration_ms=" + std::to_string(evt.duration.count())};
        } else if constexpr (std::is_same_v<T, PassPreemptedEvent>) {
          return {"INFO", "pass.preempted id=" + std::to_string(evt.pass_id)};
        } else if constexpr (std::is_same_v<T, ProbeResultEvent>) {
          return {evt.status == "OK" ? "DEBUG" : "WARN",
                  "probe.result check=" + evt.check_id + " status=" + evt.status +
                      " headline=\"" + evt.headline +
                      "\" latency_ms=" + std::to_string(evt.latency.count())};
        } else if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          return {"DEBUG", "scheduler.tick trigger=" + evt.trigger};
        } else {
          static_assert(std::is_same_v<T, ErrorEvent>, "unhandled observer event");
          return {"ERROR", evt.component + ": " + evt.message};
        }
      },
      event);
}

LogLine format_metric(const ObserverMetric &metric) {
  return std::visit(
      [](auto &&m) -> LogLine {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProbeLatencyMetric>) {
          return {"DEBUG", "metric.probe_latency_ms check=" + m.check_id +
                               " value=" + std::to_string(m.latency.count())};
        } else if constexpr (std::is_same_v<T, PassDurationMetric>) {
          return {"DEBUG", "metric.pass_duration_ms=" + std::to_string(m.duration.count())};
        } else {
          static_assert(std::is_same_v<T, ErrorLogSizeMetric>, "unhandled observer metric");
          return {"DEBUG", "metric.error_log_entries=" + std::to_string(m.entries)};
        }
      },
      metric);
}

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const LogLine &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << line.level << "] " << line.message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) { log_line(format_event(event)); }

void LogObserver::record_metric(const ObserverMetric &metric) { log_line(format_metric(metric)); }

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace linkwatch::observability
