#pragma once

#include <cstddef>
#include <string>

namespace leakguard::config {

struct RecordsConfig {
  /// "json" or "sqlite".
  std::string backend = "json";
  std::string path = "~/.leakguard/company_database.json";
};

struct GuardConfig {
  std::size_t max_input_chars = 10'000;
  std::size_t max_output_chars = 5'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  RecordsConfig records;
  GuardConfig guard;
  ObservabilityConfig observability;
};

} // namespace leakguard::config
