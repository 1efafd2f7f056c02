#include "test_framework.hpp"

#include "linkwatch/observability/factory.hpp"
#include "linkwatch/observability/file_observer.hpp"
#include "linkwatch/observability/global.hpp"
#include "linkwatch/observability/log_observer.hpp"
#include "linkwatch/observability/multi_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<linkwatch::tests::TestCase> &tests) {
  using linkwatch::tests::require;
  namespace obs = linkwatch::observability;
  using linkwatch::testing::RecordingObserver;
  using linkwatch::testing::RecordingObserverScope;

  tests.push_back({"log_observer_formats_pass_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::PassStartEvent{.pass_id = 3, .checks = 4});
                     observer.record_event(obs::PassEndEvent{
                         .pass_id = 3,
                         .overall_status = "WARNING",
                         .duration = std::chrono::milliseconds(120)});
                     const std::string text = out.str();
                     require(text.find("[INFO] pass.start id=3 checks=4") != std::string::npos,
                             "start line missing: " + text);
                     require(text.find("[INFO] pass.end id=3 overall=WARNING duration_ms=120") !=
                                 std::string::npos,
                             "end line missing: " + text);
                   }});

  tests.push_back({"log_observer_warns_on_failing_probe", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::ProbeResultEvent{.check_id = "claude_api",
                                                                 .status = "CRITICAL",
                                                                 .headline = "OVERLOADED",
                                                                 .latency = std::chrono::milliseconds(88)});
                     observer.record_event(obs::ProbeResultEvent{.check_id = "internet",
                                                                 .status = "OK",
                                                                 .headline = "ONLINE"});
                     observer.record_event(obs::ErrorEvent{.component = "config", .message = "bad"});
                     const std::string text = out.str();
                     require(text.find("[WARN] probe.result check=claude_api status=CRITICAL "
                                       "headline=\"OVERLOADED\" latency_ms=88") != std::string::npos,
                             "warn line missing: " + text);
                     require(text.find("[DEBUG] probe.result check=internet") != std::string::npos,
                             "ok result should log at debug");
                     require(text.find("[ERROR] config: bad") != std::string::npos,
                             "error line missing");
                   }});

  tests.push_back({"log_observer_formats_metrics", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_metric(obs::ErrorLogSizeMetric{.entries = 2});
                     observer.record_metric(obs::PassDurationMetric{
                         .duration = std::chrono::milliseconds(40)});
                     const std::string text = out.str();
                     require(text.find("metric.error_log_entries=2") != std::string::npos,
                             "error log metric missing");
                     require(text.find("metric.pass_duration_ms=40") != std::string::npos,
                             "duration metric missing");
                   }});

  tests.push_back({"factory_selects_backend", [] {
                     const linkwatch::testing::TempDir dir;
                     linkwatch::config::Settings settings;
                     settings.observability.file_path = (dir.path() / "history.log").string();
                     settings.observability.backend = "none";
                     require(obs::create_observer(settings) == nullptr, "none -> no observer");
                     settings.observability.backend = "LOG";
                     require(obs::create_observer(settings)->name() == "log", "log -> log");
                     settings.observability.backend = "file";
                     require(obs::create_observer(settings)->name() == "file", "file -> file");
                     settings.observability.backend = "log, file, log";
                     auto multi = obs::create_observer(settings);
                     require(multi->name() == "multi", "list -> multi");
                     const auto backends = dynamic_cast<obs::MultiObserver &>(*multi).backends();
                     require(backends == std::vector<std::string_view>{"log", "file"},
                             "each backend once, in order");
                     settings.observability.backend = "statsd";
                     require(obs::create_observer(settings)->name() == "log",
                             "unknown backend falls back to log");
                   }});

  tests.push_back({"unwritable_history_file_falls_back_to_log", [] {
                     const linkwatch::testing::TempDir dir;
                     dir.create_file("blocker", "not a directory");
                     linkwatch::config::Settings settings;
                     settings.observability.backend = "file";
                     settings.observability.file_path = (dir.path() / "blocker" / "h.log").string();
                     const linkwatch::testing::StdioCapture capture;
                     auto observer = obs::create_observer(settings);
                     require(observer != nullptr && observer->name() == "log",
                             "failed file backend falls back to log");
                   }});

  tests.push_back({"file_observer_appends_timestamped_lines", [] {
                     const linkwatch::testing::TempDir dir;
                     const auto path = dir.path() / "logs" / "history.log";
                     {
                       auto opened = obs::FileObserver::open(path);
                       require(opened.ok(), opened.error());
                       opened.value()->record_event(obs::PassStartEvent{.pass_id = 1, .checks = 4});
                     }
                     {
                       auto reopened = obs::FileObserver::open(path);
                       require(reopened.ok(), reopened.error());
                       reopened.value()->record_event(
                           obs::ErrorEvent{.component = "settings", .message = "rejected"});
                     }
                     const std::string text = dir.read_file("logs/history.log");
                     const auto first = text.find("[INFO] pass.start id=1 checks=4");
                     const auto second = text.find("[ERROR] settings: rejected");
                     require(first != std::string::npos, "first line missing: " + text);
                     require(second != std::string::npos && second > first,
                             "reopening appends: " + text);
                     require(text.size() > 20 && text[4] == '-' && text[19] == ' ',
                             "lines start with a utc timestamp: " + text);
                     require(!obs::FileObserver::open("").ok(), "empty path rejected");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<RecordingObserver>();
                     auto second = std::make_unique<RecordingObserver>();
                     auto *first_raw = first.get();
                     auto *second_raw = second.get();
                     std::vector<std::unique_ptr<obs::IObserver>> backends;
                     backends.push_back(std::move(first));
                     backends.push_back(nullptr);
                     backends.push_back(std::move(second));
                     obs::MultiObserver multi(std::move(backends));
                     multi.record_event(obs::SchedulerTickEvent{.trigger = "manual"});
                     multi.record_metric(obs::ErrorLogSizeMetric{.entries = 1});
                     require(multi.backends().size() == 2, "null backend should be dropped");
                     require(first_raw->count<obs::SchedulerTickEvent>() == 1, "first missed event");
                     require(second_raw->count<obs::SchedulerTickEvent>() == 1,
                             "second missed event");
                     require(second_raw->metrics().size() == 1, "second missed metric");
                   }});

  tests.push_back({"global_helpers_record_metrics_with_events", [] {
                     const RecordingObserverScope scope;
                     obs::record_probe_result("gpu", "OK", "NORMAL", std::chrono::milliseconds(5));
                     obs::record_pass_end(9, "OK", std::chrono::milliseconds(30));
                     auto &recorder = scope.observer();
                     require(recorder.count<obs::ProbeResultEvent>() == 1, "probe event missing");
                     require(recorder.count<obs::PassEndEvent>() == 1, "pass end missing");
                     require(recorder.metrics().size() == 2,
                             "probe latency and pass duration metrics expected");
                   }});

  tests.push_back({"global_observer_absent_is_silent", [] {
                     obs::set_global_observer(nullptr);
                     require(obs::get_global_observer() == nullptr, "observer should be unset");
                     obs::record_error("test", "nobody listening");
                     obs::record_scheduler_tick("interval");
                   }});
}
