#include "test_framework.hpp"

#include "textguard/config/schema.hpp"
#include "textguard/observability/factory.hpp"
#include "textguard/observability/global.hpp"
#include "textguard/observability/log_observer.hpp"
#include "textguard/observability/multi_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public textguard::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const textguard::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const textguard::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<textguard::tests::TestCase> &tests) {
  using textguard::tests::require;
  using textguard::tests::require_contains;
  namespace ob = textguard::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_scan_completed("scan", "safe", 0, std::chrono::microseconds(5));
                     ob::record_input_rejected("scan", "empty");

                     // Reset to prevent dangling references during static destruction
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_without_observer_is_silent", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_error("unit", "nobody listens");
                     require(ob::get_global_observer() == nullptr, "still unset");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));
                     require(multi->size() == 2, "two children");

                     ob::set_global_observer(std::move(multi));
                     ob::record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     ob::record_metric(ob::InputSizeMetric{.bytes = 3});
                     ob::get_global_observer()->flush();

                     require(one.events == 1 && two.events == 1, "event should be forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metric should be forwarded");
                     require(one.flushes == 1 && two.flushes == 1, "flush should be forwarded");

                     // Reset before local CounterState variables go out of scope
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_scan_completed_records_latency", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_scan_completed("clean", "high", 2, std::chrono::microseconds(40));
                     require(state.events == 1, "event recorded");
                     require(state.metrics == 1, "latency metric recorded");
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_log_observer_formats_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver log(out);
                     log.record_event(ob::ScanCompletedEvent{.operation = "scan",
                                                             .threat_level = "high",
                                                             .total_findings = 3,
                                                             .duration =
                                                                 std::chrono::microseconds(12)});
                     log.record_event(ob::InputRejectedEvent{.operation = "clean",
                                                             .reason = "Input text is empty"});
                     log.record_metric(ob::InputSizeMetric{.bytes = 9});
                     const std::string text = out.str();
                     require_contains(text, "[INFO] scan.completed threat_level=high findings=3",
                                      "completion line");
                     require_contains(text, "[WARN] clean.rejected reason=Input text is empty",
                                      "rejection line");
                     require_contains(text, "[DEBUG] metric.input_bytes=9", "metric line");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     textguard::config::ObservabilityConfig config;
                     config.backend = "none";
                     auto none = ob::create_observer(config);
                     require(none->name() == "noop", "none backend should map to noop");

                     config.backend = "log";
                     auto log = ob::create_observer(config);
                     require(log->name() == "log", "log backend should map to log observer");

                     config.backend = "log,noop";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "comma backend should map to multi observer");
                   }});

  tests.push_back({"observability_backend_names_normalized", [] {
                     const auto names = ob::backend_names(" Log, ,NOOP ");
                     require(names.size() == 2, "blank entries dropped");
                     require(names[0] == "log" && names[1] == "noop", "names lowercased");
                     require(ob::is_known_backend("none"), "none is known");
                     require(!ob::is_known_backend("statsd"), "statsd is unknown");
                   }});

  tests.push_back({"observability_multi_skips_noop_children", [] {
                     std::vector<std::unique_ptr<ob::IObserver>> children;
                     children.push_back(std::make_unique<ob::NoopObserver>());
                     children.push_back(nullptr);
                     ob::MultiObserver multi(std::move(children));
                     require(multi.size() == 0, "noop and null children are dropped");
                   }});
}
