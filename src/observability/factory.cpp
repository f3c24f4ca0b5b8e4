#include "leakguard/observability/factory.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/observability/log_observer.hpp"
#include "leakguard/observability/multi_observer.hpp"
#include "leakguard/observability/noop_observer.hpp"

#include <sstream>

namespace leakguard::observability {

namespace {

/// Observer for one normalized backend name, or null when the name is unknown.
std::unique_ptr<IObserver> observer_for(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    if (auto observer = observer_for(backend)) {
      return observer;
    }
    // Unknown names are rejected by validate_config; scans still get logged.
    return std::make_unique<LogObserver>();
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (auto observer = observer_for(common::trim(part))) {
      multi->add(std::move(observer));
    }
  }
  return multi;
}

} // namespace leakguard::observability
