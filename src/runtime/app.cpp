#include "leakguard/runtime/app.hpp"

#include "leakguard/config/config.hpp"
#include "leakguard/observability/factory.hpp"
#include "leakguard/observability/global.hpp"
#include "leakguard/records/factory.hpp"

namespace leakguard::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

SafetyEngine RuntimeContext::create_engine() {
  observability::set_global_observer(observability::create_observer(config_));
  return SafetyEngine(config_.guard);
}

common::Result<records::RecordStore> RuntimeContext::load_records() const {
  auto source = records::create_record_source(config_.records);
  if (!source.ok()) {
    observability::record_error("records", source.error());
    return common::Result<records::RecordStore>::failure(source.error());
  }
  auto store = source.value()->load();
  if (!store.ok()) {
    observability::record_error("records", store.error());
  }
  return store;
}

} // namespace leakguard::runtime
