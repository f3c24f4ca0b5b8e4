#pragma once

#include "leakguard/config/schema.hpp"
#include "leakguard/observability/observer.hpp"

#include <memory>

namespace leakguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace leakguard::observability
