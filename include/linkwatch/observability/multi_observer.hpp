#pragma once

#include "linkwatch/observability/observer.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace linkwatch::observability {

/// Fans every event and metric out to the configured backends, in order.
class MultiObserver final : public IObserver {
public:
  /// Null entries are dropped.
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> backends);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::vector<std::string_view> backends() const;

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
};

} // namespace linkwatch::observability
