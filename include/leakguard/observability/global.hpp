#pragma once

#include "leakguard/observability/observer.hpp"

#include <memory>

namespace leakguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_leak_scan(std::size_t entities, std::size_t findings, const std::string &severity,
                      const std::string &document_sha256, std::chrono::milliseconds duration);
void record_injection_detected(const std::string &pass, const std::string &label);
void record_input_sanitized(std::size_t input_chars, std::size_t output_chars);
void record_output_refused(const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace leakguard::observability
