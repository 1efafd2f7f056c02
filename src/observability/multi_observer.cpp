#include "linkwatch/observability/multi_observer.hpp"

#include <algorithm>

namespace linkwatch::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> backends)
    : backends_(std::move(backends)) {
  backends_.erase(std::remove(backends_.begin(), backends_.end(), nullptr), backends_.end());
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &backend : backends_) {
    backend->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &backend : backends_) {
    backend->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &backend : backends_) {
    backend->flush();
  }
}

std::vector<std::string_view> MultiObserver::backends() const {
  std::vector<std::string_view> names;
  names.reserve(backends_.size());
  for (const auto &backend : backends_) {
    names.push_back(backend->name());
  }
  return names;
}

} // namespace linkwatch::observability
