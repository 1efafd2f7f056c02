#include "test_framework.hpp"

#include "linkwatch/diag/registry.hpp"
#include "linkwatch/probes/builtin.hpp"
#include "linkwatch/probes/probes.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <mutex>

namespace {

namespace diag = linkwatch::diag;
namespace probes = linkwatch::probes;
using linkwatch::common::ErrorKind;
using linkwatch::common::Result;
using namespace std::chrono_literals;

probes::SystemMetrics metrics(const double cpu, const double ram) {
  return {.cpu_pct = cpu, .ram_pct = ram, .disk_state = "OK"};
}

diag::CheckResult run(diag::Probe &probe) {
  const diag::CancellationToken token;
  return probe.execute(500ms, token);
}

std::vector<probes::ProcessInfo> processes(std::initializer_list<std::string> names) {
  std::vector<probes::ProcessInfo> out;
  int pid = 100;
  for (const auto &name : names) {
    out.push_back({.pid = pid++, .name = name, .memory_bytes = 100ULL * 1024 * 1024});
  }
  return out;
}

/// Never answers; sleeps for whatever timeout it is given.
class StalledPinger final : public probes::Pinger {
public:
  probes::PingResult ping(const std::string &, const std::chrono::milliseconds timeout,
                          const diag::CancellationToken &cancel) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      budget_ += timeout;
    }
    const bool cancelled = cancel.wait_for(timeout);
    return {.reachable = false, .cancelled = cancelled, .latency = timeout, .error = "timed out"};
  }

  std::chrono::milliseconds budget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_;
  }

private:
  mutable std::mutex mutex_;
  std::chrono::milliseconds budget_{0};
};

} // namespace

void register_probe_tests(std::vector<linkwatch::tests::TestCase> &tests) {
  using linkwatch::tests::require;
  using linkwatch::testing::FakeGpuSource;
  using linkwatch::testing::FakeHttpClient;
  using linkwatch::testing::FakeInterfaceSource;
  using linkwatch::testing::FakeMetricSource;
  using linkwatch::testing::FakePinger;
  using linkwatch::testing::FakeProcessSource;
  using linkwatch::testing::FakeWorld;
  using linkwatch::testing::http_failure;
  using linkwatch::testing::http_status;
  using linkwatch::testing::reachable;
  using linkwatch::testing::TempDir;
  using linkwatch::testing::unreachable;

  // System resources

  tests.push_back({"resources_map_thresholds", [] {
                     auto source = std::make_shared<FakeMetricSource>();
                     probes::SystemResourceProbe probe(source);

                     source->set(Result<probes::SystemMetrics>::success(metrics(12.4, 40.0)));
                     auto result = run(probe);
                     require(result.status == diag::Status::Ok, "normal load is ok");
                     require(result.headline == "NORMAL", "normal headline");
                     require(result.detail.get("CPU") == std::optional<std::string>("12%"),
                             "cpu detail rounded");

                     source->set(Result<probes::SystemMetrics>::success(metrics(75.0, 40.0)));
                     result = run(probe);
                     require(result.status == diag::Status::Warning, "cpu above warn");
                     require(result.headline == "HIGH LOAD", "warning headline");

                     source->set(Result<probes::SystemMetrics>::success(metrics(20.0, 96.0)));
                     result = run(probe);
                     require(result.status == diag::Status::Critical, "ram above crit");
                     require(result.headline == "CRITICAL LOAD", "critical headline");
                   }});

  tests.push_back({"resources_failure_is_unknown", [] {
                     auto source = std::make_shared<FakeMetricSource>();
                     probes::SystemResourceProbe probe(source);
                     source->set(Result<probes::SystemMetrics>::failure(ErrorKind::ProbeUnavailable,
                                                                        "no /proc"));
                     auto result = run(probe);
                     require(result.status == diag::Status::Unknown, "unavailable is unknown");
                     require(result.error == std::optional<std::string>("no /proc"), "error text");

                     source->set(Result<probes::SystemMetrics>::failure(ErrorKind::ProbeTimeout,
                                                                        "cancelled"));
                     result = run(probe);
                     require(result.headline == "TIMEOUT", "cancelled sampling is a timeout");
                   }});

  tests.push_back({"proc_metric_source_reads_fixture", [] {
                     const TempDir proc;
                     proc.create_file("stat", "cpu  100 0 100 800 0 0 0 0\ncpu0 1 2 3 4\n");
                     proc.create_file("meminfo",
                                      "MemTotal:       1000 kB\nMemFree: 100 kB\nMemAvailable:    250 kB\n");
                     probes::ProcMetricSource source(proc.path(), 1ms);
                     const auto read = source.read_system_metrics(diag::CancellationToken{});
                     require(read.ok(), read.error());
                     require(read.value().cpu_pct == 0.0, "identical samples give zero cpu");
                     require(read.value().ram_pct == 75.0, "ram percentage mismatch");
                   }});

  tests.push_back({"proc_metric_source_missing_meminfo_fails", [] {
                     const TempDir proc;
                     proc.create_file("stat", "cpu 1 1 1 1 0 0 0 0\n");
                     probes::ProcMetricSource source(proc.path(), 1ms);
                     const auto read = source.read_system_metrics(diag::CancellationToken{});
                     require(!read.ok(), "missing meminfo should fail");
                     require(read.kind() == ErrorKind::ProbeUnavailable, "kind mismatch");
                   }});

  tests.push_back({"proc_metric_source_honours_cancel", [] {
                     const TempDir proc;
                     proc.create_file("stat", "cpu 1 1 1 1 0 0 0 0\n");
                     probes::ProcMetricSource source(proc.path(), 5s);
                     const diag::CancellationToken token;
                     token.cancel();
                     const auto read = source.read_system_metrics(token);
                     require(!read.ok() && read.kind() == ErrorKind::ProbeTimeout,
                             "cancelled sampling should time out");
                   }});

  // GPU

  tests.push_back({"gpu_absent_is_inactive_ok", [] {
                     auto source = std::make_shared<FakeGpuSource>();
                     probes::GpuProbe probe(source);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Ok, "no gpu is ok");
                     require(result.headline == "INACTIVE", "inactive headline");
                   }});

  tests.push_back({"gpu_busiest_card_decides", [] {
                     auto source = std::make_shared<FakeGpuSource>();
                     source->set(Result<std::vector<probes::GpuInfo>>::success(
                         {{.name = "Intel", .usage_pct = 10.0},
                          {.name = "AMD",
                           .usage_pct = 97.0,
                           .memory_used_mb = 1024,
                           .memory_total_mb = 8192}}));
                     probes::GpuProbe probe(source, 80.0, 95.0);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Critical, "overloaded gpu");
                     require(result.headline == "OVERLOADED", "overloaded headline");
                     require(result.detail.get("GPU") == std::optional<std::string>("AMD"), "gpu name");
                     require(result.detail.get("VRAM") == std::optional<std::string>("1024/8192MB"),
                             "vram detail");
                   }});

  tests.push_back({"sysfs_gpu_source_reads_cards", [] {
                     const TempDir drm;
                     drm.create_file("card0/device/vendor", "0x1002\n");
                     drm.create_file("card0/device/gpu_busy_percent", "42\n");
                     drm.create_file("card0/device/mem_info_vram_used", "1073741824\n");
                     drm.create_file("card0/device/mem_info_vram_total", "4294967296\n");
                     drm.create_file("card0-DP-1/status", "connected\n");
                     drm.create_file("card1/device/vendor", "0x8086\n");
                     probes::SysfsGpuSource source(drm.path());
                     const auto gpus = source.read_gpus();
                     require(gpus.ok(), gpus.error());
                     require(gpus.value().size() == 2, "connectors are not cards");
                     const auto &amd = gpus.value()[0];
                     require(amd.name == "AMD", "vendor mapping");
                     require(amd.usage_pct == std::optional<double>(42.0), "busy percent");
                     require(amd.memory_total_mb == std::optional<std::uint64_t>(4096), "vram total");
                     require(!gpus.value()[1].usage_pct.has_value(), "intel card has no usage file");
                   }});

  tests.push_back({"sysfs_gpu_source_missing_root_is_empty", [] {
                     probes::SysfsGpuSource source("/nonexistent/linkwatch/drm");
                     const auto gpus = source.read_gpus();
                     require(gpus.ok() && gpus.value().empty(), "missing root means no gpus");
                   }});

  // Internet

  tests.push_back({"internet_primary_reachable_is_online", [] {
                     auto pinger = std::make_shared<FakePinger>();
                     pinger->set("https://www.google.com", reachable(35ms));
                     probes::InternetProbe probe(pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Ok, "online is ok");
                     require(result.headline == "ONLINE", "online headline");
                     require(result.detail.get("HOST") == std::optional<std::string>("www.google.com"),
                             "host detail");
                     require(result.detail.get("LATENCY") == std::optional<std::string>("35ms"),
                             "latency detail");
                   }});

  tests.push_back({"internet_slow_primary_is_warning", [] {
                     auto pinger = std::make_shared<FakePinger>();
                     pinger->set("https://www.google.com", reachable(2500ms));
                     probes::InternetProbe probe(pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Warning, "slow is warning");
                     require(result.headline == "SLOW", "slow headline");
                   }});

  tests.push_back({"internet_fallback_only_is_degraded", [] {
                     auto pinger = std::make_shared<FakePinger>();
                     pinger->set("https://www.google.com", unreachable("dns failure"));
                     pinger->set("https://1.1.1.1", reachable(20ms));
                     probes::InternetProbe probe(pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Warning, "degraded is warning");
                     require(result.headline == "DEGRADED", "degraded headline");
                     require(result.error == std::optional<std::string>("www.google.com: dns failure"),
                             "error names the primary");
                   }});

  tests.push_back({"internet_nothing_reachable_is_offline", [] {
                     auto pinger = std::make_shared<FakePinger>();
                     probes::InternetProbe probe(pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Critical, "offline is critical");
                     require(result.headline == "OFFLINE", "offline headline");
                   }});

  tests.push_back({"internet_fallback_shares_the_primary_budget", [] {
                     auto pinger = std::make_shared<StalledPinger>();
                     probes::InternetProbe probe(pinger);
                     const diag::CancellationToken token;
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = probe.execute(300ms, token);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.status == diag::Status::Critical, "stalled network is critical");
                     require(result.headline == "OFFLINE", "offline headline");
                     require(pinger->budget() <= 300ms, "pings never exceed one timeout together");
                     require(elapsed < 450ms, "execute returns within its timeout");
                   }});

  // VPN

  tests.push_back({"vpn_absent_is_ok", [] {
                     auto interfaces = std::make_shared<FakeInterfaceSource>();
                     interfaces->set(Result<std::vector<probes::NetworkInterface>>::success(
                         {{.name = "lo", .up = true}, {.name = "eth0", .up = true}}));
                     auto pinger = std::make_shared<FakePinger>();
                     probes::VpnProbe probe(interfaces, pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Ok, "no vpn is not a problem");
                     require(result.headline == "INACTIVE", "inactive headline");
                   }});

  tests.push_back({"vpn_down_interface_is_ignored", [] {
                     auto interfaces = std::make_shared<FakeInterfaceSource>();
                     interfaces->set(Result<std::vector<probes::NetworkInterface>>::success(
                         {{.name = "wg0", .up = false}}));
                     probes::VpnProbe probe(interfaces, std::make_shared<FakePinger>());
                     require(run(probe).headline == "INACTIVE", "down tunnel is inactive");
                   }});

  tests.push_back({"vpn_active_and_reachable_is_ok", [] {
                     auto interfaces = std::make_shared<FakeInterfaceSource>();
                     interfaces->set(Result<std::vector<probes::NetworkInterface>>::success(
                         {{.name = "eth0", .up = true}, {.name = "tun0", .up = true}}));
                     auto pinger = std::make_shared<FakePinger>();
                     pinger->set("https://api.anthropic.com", reachable(50ms));
                     probes::VpnProbe probe(interfaces, pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Ok, "active vpn is ok");
                     require(result.headline == "ACTIVE", "active headline");
                     require(result.detail.get("INTERFACE") == std::optional<std::string>("tun0"),
                             "interface detail");
                   }});

  tests.push_back({"vpn_blocking_reference_is_critical", [] {
                     auto interfaces = std::make_shared<FakeInterfaceSource>();
                     interfaces->set(Result<std::vector<probes::NetworkInterface>>::success(
                         {{.name = "WG-corp", .up = true}}));
                     auto pinger = std::make_shared<FakePinger>();
                     probes::VpnProbe probe(interfaces, pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Critical, "blocking vpn is critical");
                     require(result.headline == "BLOCKING", "blocking headline");
                   }});

  tests.push_back({"vpn_cancelled_reference_check_is_unknown", [] {
                     auto interfaces = std::make_shared<FakeInterfaceSource>();
                     interfaces->set(Result<std::vector<probes::NetworkInterface>>::success(
                         {{.name = "tun0", .up = true}}));
                     auto pinger = std::make_shared<FakePinger>();
                     pinger->set("https://api.anthropic.com",
                                 {.reachable = false, .cancelled = true, .error = "cancelled"});
                     probes::VpnProbe probe(interfaces, pinger);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Unknown,
                             "unconfirmed blocking is unknown");
                     require(result.headline == "ACTIVE", "vpn is still reported active");
                     require(result.error.has_value(), "error explains the missing confirmation");
                     require(result.detail.get("INTERFACE") == std::optional<std::string>("tun0"),
                             "interface detail");
                   }});

  // API endpoints

  tests.push_back({"api_status_classes_map_to_states", [] {
                     const auto ok = probes::map_api_response(http_status(200, "{}"), "api.test");
                     require(ok.status == diag::Status::Ok && ok.headline == "AVAILABLE", "2xx");
                     require(!ok.detail.get("MESSAGE").has_value(), "ok has no message");

                     const auto limited = probes::map_api_response(http_status(429), "api.test");
                     require(limited.status == diag::Status::Warning, "429 is warning");
                     require(limited.headline == "RATE_LIMITED", "429 headline");
                     require(limited.detail.get("MESSAGE") ==
                                 std::optional<std::string>("rate limited"),
                             "default reason");

                     const auto overloaded = probes::map_api_response(http_status(529), "api.test");
                     require(overloaded.status == diag::Status::Critical, "529 is critical");
                     require(overloaded.headline == "OVERLOADED", "529 headline");

                     const auto down = probes::map_api_response(http_status(500), "api.test");
                     require(down.headline == "DOWN", "500 is down");

                     const auto auth = probes::map_api_response(http_status(401), "api.test");
                     require(auth.status == diag::Status::Unknown, "401 is unknown");
                     require(auth.headline == "HTTP 401", "401 headline");
                   }});

  tests.push_back({"api_503_with_html_body_uses_default_reason", [] {
                     const auto result = probes::map_api_response(
                         http_status(503, "<html>Service Unavailable</html>"), "api.anthropic.com");
                     require(result.status == diag::Status::Critical, "503 is critical");
                     require(result.headline == "OVERLOADED", "503 headline");
                     require(result.detail.get("MESSAGE") ==
                                 std::optional<std::string>("server at capacity"),
                             "html body is not echoed");
                     require(result.detail.get("STATUS") == std::optional<std::string>("503"),
                             "status detail");
                   }});

  tests.push_back({"api_json_error_message_is_extracted", [] {
                     const auto result = probes::map_api_response(
                         http_status(529, R"({"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}})"),
                         "api.anthropic.com");
                     require(result.detail.get("MESSAGE") == std::optional<std::string>("Overloaded"),
                             "json message expected");
                     require(probes::extract_error_message(R"({"error":"quota exceeded"})") ==
                                 std::optional<std::string>("quota exceeded"),
                             "string error field");
                     require(probes::extract_error_message(R"({"message":"slow down"})") ==
                                 std::optional<std::string>("slow down"),
                             "top-level message");
                     require(!probes::extract_error_message("plain text").has_value(),
                             "non-json body");
                   }});

  tests.push_back({"api_network_failure_is_down", [] {
                     const auto timed_out =
                         probes::map_api_response(http_failure("Timeout was reached", true), "h");
                     require(timed_out.status == diag::Status::Critical, "timeout is critical");
                     require(timed_out.headline == "DOWN", "timeout headline");
                     require(timed_out.error == std::optional<std::string>("timed out"),
                             "timeout error text");

                     const auto refused =
                         probes::map_api_response(http_failure("Connection refused"), "h");
                     require(refused.error == std::optional<std::string>("Connection refused"),
                             "network error text");
                   }});

  tests.push_back({"api_probe_uses_endpoint_method", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->set_default(http_status(200, "{}", 77ms));
                     probes::ApiProbe head_probe("claude_api", http,
                                                 {.url = "https://api.anthropic.com",
                                                  .headers = {},
                                                  .use_head = true});
                     const auto result = run(head_probe);
                     require(result.latency == 77ms, "latency from response");
                     const auto requests = http->requests();
                     require(requests.size() == 1 && requests[0].method == "HEAD", "head request");
                     require(probes::host_of("https://api.openai.com/v1/models") == "api.openai.com",
                             "host_of strips scheme and path");
                   }});

  // Processes

  tests.push_back({"process_running_and_missing", [] {
                     auto source = std::make_shared<FakeProcessSource>();
                     source->set(Result<std::vector<probes::ProcessInfo>>::success(
                         processes({"bash", "OpenCode.exe"})));
                     probes::ProcessProbe probe(source);
                     auto result = run(probe);
                     require(result.status == diag::Status::Ok, "running is ok");
                     require(result.headline == "RUNNING", "running headline");
                     require(result.detail.get("MEMORY") == std::optional<std::string>("100MB"),
                             "memory detail");

                     source->set(Result<std::vector<probes::ProcessInfo>>::success(
                         processes({"bash"})));
                     result = run(probe);
                     require(result.status == diag::Status::Ok, "optional client absent is ok");
                     require(result.headline == "INACTIVE", "inactive headline");

                     probes::ProcessProbe required(source, {.process_name = "opencode",
                                                            .required = true,
                                                            .memory_limit_mb = 2000});
                     result = run(required);
                     require(result.status == diag::Status::Critical, "required client absent");
                     require(result.headline == "NOT RUNNING", "not running headline");
                   }});

  tests.push_back({"process_memory_over_limit_warns", [] {
                     auto source = std::make_shared<FakeProcessSource>();
                     source->set(Result<std::vector<probes::ProcessInfo>>::success(
                         processes({"opencode", "opencode"})));
                     probes::ProcessProbe probe(source, {.process_name = "opencode",
                                                         .required = false,
                                                         .memory_limit_mb = 150});
                     const auto result = run(probe);
                     require(result.status == diag::Status::Warning, "over limit warns");
                     require(result.headline == "HIGH MEMORY", "high memory headline");
                     require(result.detail.get("INSTANCES") == std::optional<std::string>("2"),
                             "instance count");
                   }});

  tests.push_back({"terminal_sessions_counted", [] {
                     auto source = std::make_shared<FakeProcessSource>();
                     source->set(Result<std::vector<probes::ProcessInfo>>::success(
                         processes({"kitty", "kitty", "tmux", "bash"})));
                     probes::TerminalProbe probe(source, {"kitty", "tmux", "xterm"}, 2);
                     const auto result = run(probe);
                     require(result.status == diag::Status::Warning, "three sessions above two");
                     require(result.headline == "MANY SESSIONS", "many sessions headline");
                     require(result.detail.get("TERMINALS") ==
                                 std::optional<std::string>("kitty, tmux"),
                             "terminal kinds");

                     probes::TerminalProbe none(source, {"xterm"}, 2);
                     require(run(none).headline == "INACTIVE", "no terminals is inactive");
                   }});

  tests.push_back({"procfs_source_reads_fixture", [] {
                     const TempDir proc;
                     proc.create_file("100/comm", "opencode\n");
                     proc.create_file("100/status", "Name:\topencode\nVmRSS:\t    2048 kB\n");
                     proc.create_file("42/comm", "bash\n");
                     proc.create_file("self/comm", "ignored\n");
                     probes::ProcfsProcessSource source(proc.path());
                     const auto listed = source.list_processes();
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 2, "only pid directories");
                     require(listed.value()[0].pid == 42, "sorted by pid");
                     require(listed.value()[1].memory_bytes == 2048ULL * 1024, "rss bytes");
                     require(probes::find_processes(listed.value(), "OPENCODE").size() == 1,
                             "case-insensitive match");
                   }});

  // Built-in registration

  tests.push_back({"builtin_checks_register_in_display_order", [] {
                     const FakeWorld world;
                     diag::CheckRegistry registry;
                     const auto status = probes::register_builtin_checks(
                         registry, linkwatch::config::Settings{}, world.collaborators());
                     require(status.ok(), status.error());
                     const auto all = registry.list_all();
                     require(all.size() == linkwatch::config::builtin_check_ids().size(),
                             "every built-in check registered");
                     for (std::size_t i = 0; i < all.size(); ++i) {
                       require(all[i].id == linkwatch::config::builtin_check_ids()[i],
                               "registration order mismatch at " + all[i].id);
                     }
                     require(registry.find("opencode")->display_name == "OPENCODE",
                             "client display name");
                     require(registry.enabled_ids() ==
                                 std::set<std::string>{"local_resources", "internet", "claude_api",
                                                       "opencode"},
                             "default enabled set");
                   }});

  tests.push_back({"claude_check_sends_key_headers", [] {
                     const FakeWorld world;
                     linkwatch::config::Settings settings;
                     settings.enabled_checks = {"claude_api"};
                     settings.apis.anthropic_key = "sk-test";
                     diag::CheckRegistry registry;
                     require(probes::register_builtin_checks(registry, settings,
                                                             world.collaborators())
                                 .ok(),
                             "registration failed");
                     const auto enabled = registry.list_enabled();
                     require(enabled.size() == 1, "only claude enabled");
                     const auto result = run(*enabled[0].probe);
                     require(result.status == diag::Status::Ok, "fake api answers 200");
                     const auto requests = world.http->requests();
                     require(requests.size() == 1, "one request");
                     require(requests[0].url == "https://api.anthropic.com/v1/models",
                             "models endpoint with a key");
                     require(requests[0].headers.at("x-api-key") == "sk-test", "key header");
                     require(requests[0].headers.at("anthropic-version") == "2023-06-01",
                             "version header");
                   }});
}
