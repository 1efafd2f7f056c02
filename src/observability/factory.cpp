#include "linkwatch/observability/factory.hpp"

#include "linkwatch/common/strings.hpp"
#include "linkwatch/observability/file_observer.hpp"
#include "linkwatch/observability/log_observer.hpp"
#include "linkwatch/observability/multi_observer.hpp"

#include <iostream>
#include <vector>

namespace linkwatch::observability {

std::unique_ptr<IObserver> create_observer(const config::Settings &settings) {
  const std::string backend = common::to_lower(common::trim(settings.observability.backend));
  const auto parts = common::split(backend, ',');
  if (parts.empty() || (parts.size() == 1 && parts[0] == "none")) {
    return nullptr;
  }

  std::vector<std::unique_ptr<IObserver>> observers;
  bool has_log = false;
  bool has_file = false;
  for (const auto &part : parts) {
    if (part == "none") {
      continue;
    }
    if (part == "file") {
      if (has_file) {
        continue;
      }
      auto opened = FileObserver::open(common::expand_path(settings.observability.file_path));
      if (!opened.ok()) {
        std::cerr << "[WARN] observability: " << opened.error() << "\n";
        continue;
      }
      observers.push_back(std::move(opened.value()));
      has_file = true;
      continue;
    }
    // "log" and unknown names both log to stderr.
    if (!has_log) {
      observers.push_back(std::make_unique<LogObserver>());
      has_log = true;
    }
  }

  if (observers.empty()) {
    return std::make_unique<LogObserver>();
  }
  if (observers.size() == 1) {
    return std::move(observers.front());
  }
  return std::make_unique<MultiObserver>(std::move(observers));
}

} // namespace linkwatch::observability
