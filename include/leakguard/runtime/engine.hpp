#pragma once

#include "leakguard/config/schema.hpp"
#include "leakguard/leak/report.hpp"
#include "leakguard/records/record.hpp"
#include "leakguard/security/injection.hpp"

#include <optional>
#include <string>

namespace leakguard::runtime {

/// Single entry point for the guard operations, using the configured limits and reporting
/// detections, scans and refusals through the global observer.
class SafetyEngine {
public:
  explicit SafetyEngine(config::GuardConfig limits = {});

  [[nodiscard]] const config::GuardConfig &limits() const { return limits_; }

  [[nodiscard]] std::optional<security::InjectionMatch>
  find_injection(const std::string &text) const;
  [[nodiscard]] bool detect_injection(const std::string &text) const;
  [[nodiscard]] std::string sanitize_input(const std::string &text) const;

  [[nodiscard]] leak::LeakReport build_leak_report(const std::string &document,
                                                   const records::RecordStore &store) const;
  [[nodiscard]] leak::LeakReport
  build_leak_report(const std::string &document, const records::ConfidentialRecord &record) const;

  [[nodiscard]] bool validate_output(const std::string &text) const;
  [[nodiscard]] std::string filter_output(const std::string &text) const;

private:
  config::GuardConfig limits_;
};

} // namespace leakguard::runtime
