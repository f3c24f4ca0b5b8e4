#include "leakguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace leakguard::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LeakScanEvent>) {
          log_line(*out_, "INFO",
                   "leak.scan entities=" + std::to_string(evt.entities) +
                       " findings=" + std::to_string(evt.findings) + " severity=" + evt.severity +
                       " sha256=" + evt.document_sha256 +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, InjectionDetectedEvent>) {
          log_line(*out_, "WARN", "injection.detected pass=" + evt.pass + " label=" + evt.label);
        } else if constexpr (std::is_same_v<T, InputSanitizedEvent>) {
          log_line(*out_, "DEBUG",
                   "input.sanitized input_chars=" + std::to_string(evt.input_chars) +
                       " output_chars=" + std::to_string(evt.output_chars));
        } else if constexpr (std::is_same_v<T, OutputRefusedEvent>) {
          log_line(*out_, "WARN", "output.refused reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line(*out_, "DEBUG", "metric.scan_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, FindingsMetric>) {
          log_line(*out_, "DEBUG", "metric.findings=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace leakguard::observability
