#include "leakguard/runtime/engine.hpp"

#include "leakguard/common/hash.hpp"
#include "leakguard/common/utf8.hpp"
#include "leakguard/observability/global.hpp"
#include "leakguard/security/output_validator.hpp"

#include <chrono>

namespace leakguard::runtime {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

void report_scan(const leak::LeakReport &report, const std::size_t entities,
                 const std::string &document, const Clock::time_point start) {
  observability::record_leak_scan(entities, report.total_count,
                                  std::string(leak::severity_label(report.severity)),
                                  common::sha256_hex(document), elapsed_since(start));
}

} // namespace

SafetyEngine::SafetyEngine(config::GuardConfig limits) : limits_(limits) {}

std::optional<security::InjectionMatch>
SafetyEngine::find_injection(const std::string &text) const {
  auto match = security::find_injection(text);
  if (match.has_value()) {
    observability::record_injection_detected(
        std::string(security::injection_pass_label(match->pass)), match->label);
  }
  return match;
}

bool SafetyEngine::detect_injection(const std::string &text) const {
  return find_injection(text).has_value();
}

std::string SafetyEngine::sanitize_input(const std::string &text) const {
  std::string sanitized = security::sanitize_input(text, limits_.max_input_chars);
  observability::record_input_sanitized(common::utf8_length(text),
                                        common::utf8_length(sanitized));
  return sanitized;
}

leak::LeakReport SafetyEngine::build_leak_report(const std::string &document,
                                                 const records::RecordStore &store) const {
  const auto start = Clock::now();
  auto report = leak::build_leak_report(document, store);
  report_scan(report, store.size(), document, start);
  return report;
}

leak::LeakReport SafetyEngine::build_leak_report(const std::string &document,
                                                 const records::ConfidentialRecord &record) const {
  const auto start = Clock::now();
  auto report = leak::build_leak_report(document, record);
  report_scan(report, 1, document, start);
  return report;
}

bool SafetyEngine::validate_output(const std::string &text) const {
  return security::validate_output(text);
}

std::string SafetyEngine::filter_output(const std::string &text) const {
  if (const auto violation = security::find_output_violation(text); violation.has_value()) {
    observability::record_output_refused(*violation);
    return security::REFUSAL_MESSAGE;
  }
  if (common::utf8_length(text) > limits_.max_output_chars) {
    observability::record_output_refused("length");
    return security::REFUSAL_MESSAGE;
  }
  return text;
}

} // namespace leakguard::runtime
