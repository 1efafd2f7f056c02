#include "linkwatch/observability/global.hpp"

#include <mutex>

namespace linkwatch::observability {

namespace {

std::mutex g_observer_mutex;
// Shared so that a recording thread keeps the observer alive across a swap.
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_pass_start(const std::uint64_t pass_id, const std::size_t checks) {
  record_event(PassStartEvent{.pass_id = pass_id, .checks = checks});
}

void record_pass_end(const std::uint64_t pass_id, const std::string &overall_status,
                     const std::chrono::milliseconds duration) {
  record_event(
      PassEndEvent{.pass_id = pass_id, .overall_status = overall_status, .duration = duration});
  record_metric(PassDurationMetric{.duration = duration});
}

void record_pass_preempted(const std::uint64_t pass_id) {
  record_event(PassPreemptedEvent{.pass_id = pass_id});
}

void record_probe_result(const std::string &check_id, const std::string &status,
                         const std::string &headline, const std::chrono::milliseconds latency) {
  record_event(ProbeResultEvent{
      .check_id = check_id, .status = status, .headline = headline, .latency = latency});
  record_metric(ProbeLatencyMetric{.check_id = check_id, .latency = latency});
}

void record_scheduler_tick(const std::string &trigger) {
  record_event(SchedulerTickEvent{.trigger = trigger});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace linkwatch::observability
