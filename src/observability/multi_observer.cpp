#include "textguard/observability/multi_observer.hpp"

namespace textguard::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> children) {
  for (auto &child : children) {
    add(std::move(child));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || observer->name() == "noop") {
    return;
  }
  children_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &child : children_) {
    child->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &child : children_) {
    child->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &child : children_) {
    child->flush();
  }
}

} // namespace textguard::observability
