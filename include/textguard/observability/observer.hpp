#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace textguard::observability {

struct ScanCompletedEvent {
  std::string operation;
  std::string threat_level;
  std::uint64_t total_findings = 0;
  std::chrono::microseconds duration{0};
};

struct InputRejectedEvent {
  std::string operation;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ScanCompletedEvent, InputRejectedEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct InputSizeMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<ScanLatencyMetric, InputSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace textguard::observability
