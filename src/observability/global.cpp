#include "leakguard/observability/global.hpp"

#include <mutex>

namespace leakguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_leak_scan(const std::size_t entities, const std::size_t findings,
                      const std::string &severity, const std::string &document_sha256,
                      const std::chrono::milliseconds duration) {
  record_event(LeakScanEvent{.entities = entities,
                             .findings = findings,
                             .severity = severity,
                             .document_sha256 = document_sha256,
                             .duration = duration});
  record_metric(ScanLatencyMetric{.latency = duration});
  record_metric(FindingsMetric{.count = findings});
}

void record_injection_detected(const std::string &pass, const std::string &label) {
  record_event(InjectionDetectedEvent{.pass = pass, .label = label});
}

void record_input_sanitized(const std::size_t input_chars, const std::size_t output_chars) {
  record_event(InputSanitizedEvent{.input_chars = input_chars, .output_chars = output_chars});
}

void record_output_refused(const std::string &reason) {
  record_event(OutputRefusedEvent{.reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace leakguard::observability
