#include "textguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace textguard::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScanCompletedEvent>) {
          log_line("INFO", evt.operation + ".completed threat_level=" + evt.threat_level +
                               " findings=" + std::to_string(evt.total_findings) +
                               " duration_us=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, InputRejectedEvent>) {
          log_line("WARN", evt.operation + ".rejected reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line("DEBUG", "metric.scan_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, InputSizeMetric>) {
          log_line("DEBUG", "metric.input_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace textguard::observability
