#pragma once

#include "textguard/observability/observer.hpp"

#include <memory>
#include <vector>

namespace textguard::observability {

/// Discards everything. Selected by the `none` and `noop` backends.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Fans every event and metric out to each child in insertion order.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> children);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return children_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace textguard::observability
