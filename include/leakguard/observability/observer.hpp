#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace leakguard::observability {

struct LeakScanEvent {
  std::size_t entities = 0;
  std::size_t findings = 0;
  std::string severity;
  std::string document_sha256;
  std::chrono::milliseconds duration{0};
};

struct InjectionDetectedEvent {
  /// "pattern" or "fuzzy".
  std::string pass;
  std::string label;
};

struct InputSanitizedEvent {
  std::size_t input_chars = 0;
  std::size_t output_chars = 0;
};

struct OutputRefusedEvent {
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LeakScanEvent, InjectionDetectedEvent, InputSanitizedEvent,
                                   OutputRefusedEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct FindingsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ScanLatencyMetric, FindingsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace leakguard::observability
