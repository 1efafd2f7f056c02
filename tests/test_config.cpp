#include "test_framework.hpp"

#include "linkwatch/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

void register_config_tests(std::vector<linkwatch::tests::TestCase> &tests) {
  using linkwatch::tests::require;
  using linkwatch::testing::ConfigOverrideGuard;
  using linkwatch::testing::EnvGuard;
  using linkwatch::testing::TempDir;
  namespace cfg = linkwatch::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("LINKWATCH_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value().filename() == ".linkwatch", "config folder name mismatch");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const TempDir dir;
                     const ConfigOverrideGuard cfg_override(dir.path() / "config.toml");
                     const EnvGuard refresh("LINKWATCH_REFRESH", std::nullopt);
                     const EnvGuard timeout("LINKWATCH_PROBE_TIMEOUT_MS", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &settings = loaded.value();
                     require(settings.refresh_interval == cfg::RefreshInterval::Min1,
                             "default interval should be 1m");
                     require(!settings.auto_refresh, "auto refresh defaults off");
                     require(settings.enabled_checks.size() == 4, "default check set size");
                     require(settings.timeouts.probe_ms == 5000, "default probe timeout");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const TempDir dir;
                     dir.create_file("config.toml", R"(
enabled_checks = ["internet", "vpn"]
refresh_interval = "30s"
auto_refresh = true

[timeouts]
probe_ms = 2000

[thresholds]
cpu_warn = 60
cpu_crit = 80

[processes]
client_name = "aider"
client_required = true

[observability]
backend = "log,file"
file_path = "/var/tmp/linkwatch-history.log"
)");
                     const ConfigOverrideGuard cfg_override(dir.path() / "config.toml");
                     const EnvGuard refresh("LINKWATCH_REFRESH", std::nullopt);
                     const EnvGuard timeout("LINKWATCH_PROBE_TIMEOUT_MS", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &settings = loaded.value();
                     require(settings.enabled_checks.size() == 2, "enabled checks mismatch");
                     require(settings.enabled_checks[1] == "vpn", "vpn should be enabled");
                     require(settings.refresh_interval == cfg::RefreshInterval::Sec30,
                             "interval mismatch");
                     require(settings.auto_refresh, "auto refresh should be on");
                     require(settings.timeouts.probe_ms == 2000, "probe timeout mismatch");
                     require(settings.timeouts.run_deadline_ms == 6000,
                             "deadline should follow probe timeout");
                     require(settings.thresholds.cpu_warn == 60.0, "cpu warn mismatch");
                     require(settings.thresholds.ram_warn == 85.0, "ram warn keeps default");
                     require(settings.processes.client_name == "aider", "client name mismatch");
                     require(settings.processes.client_required, "client required mismatch");
                     require(settings.observability.backend == "log,file", "backend mismatch");
                     require(settings.observability.file_path == "/var/tmp/linkwatch-history.log",
                             "history path mismatch");
                   }});

  tests.push_back({"invalid_refresh_interval_is_configuration_error", [] {
                     const auto parsed = cfg::parse_settings("refresh_interval = \"7m\"\n");
                     require(!parsed.ok(), "7m should be rejected");
                     require(parsed.kind() == linkwatch::common::ErrorKind::ConfigurationError,
                             "kind mismatch");
                   }});

  tests.push_back({"refresh_interval_names_round_trip", [] {
                     for (const auto interval :
                          {cfg::RefreshInterval::Off, cfg::RefreshInterval::Sec30,
                           cfg::RefreshInterval::Min1, cfg::RefreshInterval::Min2,
                           cfg::RefreshInterval::Min5}) {
                       const auto parsed = cfg::parse_refresh_interval(
                           cfg::refresh_interval_name(interval));
                       require(parsed.has_value() && *parsed == interval, "name round trip");
                     }
                     require(cfg::parse_refresh_interval("300") == cfg::RefreshInterval::Min5,
                             "seconds form");
                     require(cfg::refresh_interval_duration(cfg::RefreshInterval::Min2) ==
                                 std::chrono::seconds(120),
                             "duration mismatch");
                     require(cfg::refresh_interval_duration(cfg::RefreshInterval::Off).count() == 0,
                             "off has zero duration");
                   }});

  tests.push_back({"save_then_load_preserves_settings", [] {
                     const TempDir dir;
                     const ConfigOverrideGuard cfg_override(dir.path() / "nested" / "config.toml");
                     const EnvGuard refresh("LINKWATCH_REFRESH", std::nullopt);
                     const EnvGuard timeout("LINKWATCH_PROBE_TIMEOUT_MS", std::nullopt);
                     const EnvGuard key("ANTHROPIC_API_KEY", std::nullopt);

                     cfg::Settings settings;
                     settings.enabled_checks = {"gpu", "terminals"};
                     settings.refresh_interval = cfg::RefreshInterval::Min5;
                     settings.auto_refresh = true;
                     settings.network.vpn_interfaces = {"wg"};
                     settings.apis.anthropic_key = "sk-secret";
                     const auto saved = cfg::save_config(settings);
                     require(saved.ok(), saved.error());

                     const std::string raw = dir.read_file("nested/config.toml");
                     require(raw.find("sk-secret") == std::string::npos,
                             "api keys must never be written");
                     require(!std::filesystem::exists(dir.path() / "nested" / "config.toml.tmp"),
                             "temporary file should be renamed");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().enabled_checks == settings.enabled_checks,
                             "enabled checks mismatch");
                     require(loaded.value().refresh_interval == cfg::RefreshInterval::Min5,
                             "interval mismatch");
                     require(loaded.value().network.vpn_interfaces.size() == 1, "vpn prefixes");
                     require(!loaded.value().apis.anthropic_key.has_value(), "key not persisted");
                   }});

  tests.push_back({"env_override_precedence", [] {
                     const TempDir dir;
                     dir.create_file("config.toml", "refresh_interval = \"2m\"\n");
                     const ConfigOverrideGuard cfg_override(dir.path() / "config.toml");
                     const EnvGuard refresh("LINKWATCH_REFRESH", std::optional<std::string>("30s"));
                     const EnvGuard timeout("LINKWATCH_PROBE_TIMEOUT_MS",
                                            std::optional<std::string>("750"));
                     const EnvGuard key("OPENAI_API_KEY", std::optional<std::string>("sk-env"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().refresh_interval == cfg::RefreshInterval::Sec30,
                             "env interval should win");
                     require(loaded.value().timeouts.probe_ms == 750, "env timeout should win");
                     require(loaded.value().apis.openai_key == std::optional<std::string>("sk-env"),
                             "openai key from env");
                   }});

  tests.push_back({"env_config_path_is_used", [] {
                     const TempDir dir;
                     dir.create_file("custom.toml", "theme = \"light\"\n");
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_path("LINKWATCH_CONFIG_PATH",
                                             (dir.path() / "custom.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == dir.path() / "custom.toml", "env path mismatch");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().theme == "light", "theme should load from env path");
                   }});

  tests.push_back({"validate_rejects_unknown_check_id", [] {
                     cfg::Settings settings;
                     settings.enabled_checks = {"internet", "telepathy"};
                     const auto result = cfg::validate_config(settings);
                     require(!result.ok(), "unknown id should fail");
                     require(result.error().find("telepathy") != std::string::npos,
                             "error should name the id");
                   }});

  tests.push_back({"validate_rejects_bad_thresholds_and_urls", [] {
                     cfg::Settings thresholds;
                     thresholds.thresholds.cpu_warn = 95.0;
                     thresholds.thresholds.cpu_crit = 90.0;
                     require(!cfg::validate_config(thresholds).ok(), "warn above crit should fail");

                     cfg::Settings range;
                     range.thresholds.ram_crit = 150.0;
                     require(!cfg::validate_config(range).ok(), "threshold above 100 should fail");

                     cfg::Settings url;
                     url.apis.openai_url = "ftp://example.com";
                     require(!cfg::validate_config(url).ok(), "non-http url should fail");

                     cfg::Settings timeout;
                     timeout.timeouts.probe_ms = 0;
                     require(!cfg::validate_config(timeout).ok(), "zero timeout should fail");

                     cfg::Settings history;
                     history.observability.backend = "log,file";
                     history.observability.file_path = " ";
                     require(!cfg::validate_config(history).ok(),
                             "file backend without a path should fail");
                   }});

  tests.push_back({"validate_reports_soft_warnings", [] {
                     cfg::Settings settings;
                     settings.enabled_checks.clear();
                     settings.observability.backend = "statsd";
                     const auto result = cfg::validate_config(settings);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "expected two warnings");
                   }});

  tests.push_back({"validate_accepts_custom_known_ids", [] {
                     cfg::Settings settings;
                     settings.enabled_checks = {"alpha"};
                     require(cfg::validate_config(settings, {"alpha", "beta"}).ok(),
                             "custom ids should validate");
                     require(!cfg::validate_config(settings).ok(),
                             "alpha is not a built-in id");
                   }});
}
