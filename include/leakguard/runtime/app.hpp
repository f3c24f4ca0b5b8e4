#pragma once

#include "leakguard/common/result.hpp"
#include "leakguard/config/schema.hpp"
#include "leakguard/records/record.hpp"
#include "leakguard/runtime/engine.hpp"

namespace leakguard::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer globally and returns an engine with the guard limits.
  [[nodiscard]] SafetyEngine create_engine();

  [[nodiscard]] common::Result<records::RecordStore> load_records() const;

private:
  config::Config config_;
};

} // namespace leakguard::runtime
