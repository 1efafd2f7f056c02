#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace linkwatch::observability {

struct PassStartEvent {
  std::uint64_t pass_id = 0;
  std::size_t checks = 0;
};

struct PassEndEvent {
  std::uint64_t pass_id = 0;
  std::string overall_status;
  std::chrono::milliseconds duration{0};
};

struct PassPreemptedEvent {
  std::uint64_t pass_id = 0;
};

struct ProbeResultEvent {
  std::string check_id;
  std::string status;
  std::string headline;
  std::chrono::milliseconds latency{0};
};

struct SchedulerTickEvent {
  std::string trigger;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<PassStartEvent, PassEndEvent, PassPreemptedEvent,
                                   ProbeResultEvent, SchedulerTickEvent, ErrorEvent>;

struct ProbeLatencyMetric {
  std::string check_id;
  std::chrono::milliseconds latency{0};
};

struct PassDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct ErrorLogSizeMetric {
  std::uint64_t entries = 0;
};

using ObserverMetric = std::variant<ProbeLatencyMetric, PassDurationMetric, ErrorLogSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace linkwatch::observability
