#pragma once

#include "linkwatch/observability/observer.hpp"

#include <memory>

namespace linkwatch::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_pass_start(std::uint64_t pass_id, std::size_t checks);
void record_pass_end(std::uint64_t pass_id, const std::string &overall_status,
                     std::chrono::milliseconds duration);
void record_pass_preempted(std::uint64_t pass_id);
void record_probe_result(const std::string &check_id, const std::string &status,
                         const std::string &headline, std::chrono::milliseconds latency);
void record_scheduler_tick(const std::string &trigger);
void record_error(const std::string &component, const std::string &message);

} // namespace linkwatch::observability
