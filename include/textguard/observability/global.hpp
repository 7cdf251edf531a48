#pragma once

#include "textguard/observability/observer.hpp"

#include <memory>

namespace textguard::observability {

/// Replaces the process-wide observer. Callers already inside `record_*` finish with the
/// observer they started with.
void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);
void flush_global_observer();

void record_scan_completed(const std::string &operation, const std::string &threat_level,
                           std::uint64_t total_findings, std::chrono::microseconds duration);
void record_input_rejected(const std::string &operation, const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace textguard::observability
