#include "textguard/observability/factory.hpp"

#include "textguard/common/strings.hpp"
#include "textguard/observability/log_observer.hpp"
#include "textguard/observability/multi_observer.hpp"

namespace textguard::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

std::vector<std::string> backend_names(const std::string &list) {
  std::vector<std::string> names;
  for (const auto &part : common::split(list, ',')) {
    std::string name = common::to_lower(common::trim(part));
    if (!name.empty()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

bool is_known_backend(const std::string_view name) {
  return name == "none" || name == "noop" || name == "log";
}

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const auto names = backend_names(config.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return create_single(names.front());
  }

  std::vector<std::unique_ptr<IObserver>> children;
  children.reserve(names.size());
  for (const auto &name : names) {
    children.push_back(create_single(name));
  }
  return std::make_unique<MultiObserver>(std::move(children));
}

} // namespace textguard::observability
