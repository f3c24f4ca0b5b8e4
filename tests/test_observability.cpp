#include "test_framework.hpp"

#include "leakguard/observability/factory.hpp"
#include "leakguard/observability/global.hpp"
#include "leakguard/observability/log_observer.hpp"
#include "leakguard/observability/multi_observer.hpp"
#include "leakguard/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<leakguard::tests::TestCase> &tests) {
  using leakguard::tests::require;
  namespace obs = leakguard::observability;
  namespace testing = leakguard::testing;

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto config = testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, none";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list is multi");
                     require(dynamic_cast<obs::MultiObserver &>(*multi).size() == 2,
                             "multi should hold both observers");
                   }});

  tests.push_back({"observability_factory_ignores_case", [] {
                     auto config = testing::mock_config();
                     config.observability.backend = " Log ";
                     require(obs::create_observer(config)->name() == "log",
                             "mixed case should select the log observer");
                     config.observability.backend = "LOG,Noop,bogus";
                     auto multi = obs::create_observer(config);
                     require(dynamic_cast<obs::MultiObserver &>(*multi).size() == 2,
                             "unknown list entries are skipped");
                   }});

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::LeakScanEvent{.entities = 2,
                                                              .findings = 3,
                                                              .severity = "LOW",
                                                              .document_sha256 = "abc",
                                                              .duration =
                                                                  std::chrono::milliseconds(7)});
                     observer.record_event(
                         obs::InjectionDetectedEvent{.pass = "fuzzy", .label = "ignore"});
                     observer.record_metric(obs::FindingsMetric{.count = 3});
                     observer.flush();
                     const std::string text = out.str();
                     require(text.find("[INFO] leak.scan entities=2 findings=3 severity=LOW "
                                       "sha256=abc duration_ms=7") != std::string::npos,
                             "scan line missing: " + text);
                     require(text.find("[WARN] injection.detected pass=fuzzy label=ignore") !=
                                 std::string::npos,
                             "injection line missing: " + text);
                     require(text.find("[DEBUG] metric.findings=3") != std::string::npos,
                             "metric line missing: " + text);
                   }});

  tests.push_back({"observability_multi_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<testing::RecordingObserver>();
                     auto second = std::make_unique<testing::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are ignored");

                     multi.record_event(obs::OutputRefusedEvent{.reason = "length"});
                     multi.record_metric(obs::ScanLatencyMetric{});
                     require(first_ptr->events().size() == 1 && second_ptr->events().size() == 1,
                             "both should see the event");
                     require(first_ptr->metrics().size() == 1, "metric should fan out");
                   }});

  tests.push_back({"observability_global_helpers", [] {
                     auto recorder = std::make_unique<testing::RecordingObserver>();
                     auto *recorder_ptr = recorder.get();
                     obs::set_global_observer(std::move(recorder));

                     obs::record_leak_scan(1, 4, "LOW", "deadbeef", std::chrono::milliseconds(2));
                     obs::record_injection_detected("pattern", "reveal prompt");
                     obs::record_error("records", "boom");

                     const auto events = recorder_ptr->events();
                     require(events.size() == 3, "expected three events");
                     require(std::holds_alternative<obs::LeakScanEvent>(events[0]),
                             "first event should be a scan");
                     require(std::get<obs::LeakScanEvent>(events[0]).findings == 4,
                             "findings mismatch");
                     require(std::holds_alternative<obs::ErrorEvent>(events[2]),
                             "last event should be an error");
                     const auto metrics = recorder_ptr->metrics();
                     require(metrics.size() == 2, "scan should emit latency and findings metrics");
                     require(std::get<obs::FindingsMetric>(metrics[1]).count == 4,
                             "findings metric mismatch");

                     obs::set_global_observer(nullptr);
                     obs::record_error("records", "dropped");
                     require(obs::get_global_observer() == nullptr, "observer should be cleared");
                   }});
}
