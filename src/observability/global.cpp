#include "textguard/observability/global.hpp"

#include <mutex>
#include <utility>

namespace textguard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::exchange(g_observer, std::shared_ptr<IObserver>(std::move(observer)));
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() { return current_observer().get(); }

void record_event(const ObserverEvent &event) {
  if (const auto observer = current_observer()) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = current_observer()) {
    observer->record_metric(metric);
  }
}

void flush_global_observer() {
  if (const auto observer = current_observer()) {
    observer->flush();
  }
}

void record_scan_completed(const std::string &operation, const std::string &threat_level,
                           const std::uint64_t total_findings,
                           const std::chrono::microseconds duration) {
  record_event(ScanCompletedEvent{.operation = operation,
                                  .threat_level = threat_level,
                                  .total_findings = total_findings,
                                  .duration = duration});
  record_metric(ScanLatencyMetric{.latency = duration});
}

void record_input_rejected(const std::string &operation, const std::string &reason) {
  record_event(InputRejectedEvent{.operation = operation, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace textguard::observability
