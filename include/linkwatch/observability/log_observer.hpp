#pragma once

#include "linkwatch/observability/observer.hpp"

#include <iosfwd>
#include <mutex>
#include <string>

namespace linkwatch::observability {

struct LogLine {
  const char *level;
  std::string message;
};

/// Shared by the text backends so every sink renders events identically.
[[nodiscard]] LogLine format_event(const ObserverEvent &event);
[[nodiscard]] LogLine format_metric(const ObserverMetric &metric);

/// Writes one "[LEVEL] message" line per event. Defaults to stderr.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const LogLine &line);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace linkwatch::observability
