#include "linkwatch/cli/commands.hpp"

#include "linkwatch/common/strings.hpp"
#include "linkwatch/config/config.hpp"
#include "linkwatch/diag/service.hpp"
#include "linkwatch/observability/factory.hpp"
#include "linkwatch/observability/global.hpp"
#include "linkwatch/sinks/sink.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace linkwatch::cli {

namespace {

std::optional<probes::Collaborators> g_collaborators_override;

std::string version_string() {
#ifdef LINKWATCH_VERSION
  std::string version = LINKWATCH_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "linkwatch " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

int exit_code_for(const diag::Status status) {
  switch (status) {
  case diag::Status::Ok:
    return EXIT_STATUS_OK;
  case diag::Status::Unknown:
    return EXIT_STATUS_UNKNOWN;
  case diag::Status::Warning:
    return EXIT_STATUS_WARNING;
  case diag::Status::Critical:
    return EXIT_STATUS_CRITICAL;
  }
  return EXIT_STATUS_UNKNOWN;
}

common::Result<config::Settings> load_settings() {
  auto settings = config::load_config();
  if (!settings.ok()) {
    return settings;
  }
  const auto validated = config::validate_config(settings.value());
  if (!validated.ok()) {
    return common::Result<config::Settings>::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] config: " << warning << "\n";
  }
  return settings;
}

probes::Collaborators collaborators() {
  if (g_collaborators_override.has_value()) {
    return *g_collaborators_override;
  }
  return probes::make_system_collaborators();
}

void install_observer(const config::Settings &settings) {
  observability::set_global_observer(observability::create_observer(settings));
}

/// Settings plus a service with the built-in checks registered.
common::Result<std::unique_ptr<diag::DiagnosticsService>>
build_service(const config::Settings &settings) {
  using ServiceResult = common::Result<std::unique_ptr<diag::DiagnosticsService>>;
  auto service = std::make_unique<diag::DiagnosticsService>(settings);
  const auto registered = probes::install_builtin_checks(*service, settings, collaborators());
  if (!registered.ok()) {
    return ServiceResult::failure(registered);
  }
  return ServiceResult::success(std::move(service));
}

int run_check(std::vector<std::string> args) {
  std::string only;
  const bool has_only = take_option(args, "--only", only);
  const bool include_log = take_flag(args, "--log");
  if (!args.empty()) {
    std::cerr << "unknown argument for check: " << args.front() << "\n";
    return EXIT_ERROR;
  }

  auto settings = load_settings();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }
  if (has_only) {
    settings.value().enabled_checks = common::split(only, ',');
    if (const auto validated = config::validate_config(settings.value()); !validated.ok()) {
      std::cerr << validated.error() << "\n";
      return EXIT_ERROR;
    }
  }

  install_observer(settings.value());
  auto service = build_service(settings.value());
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return EXIT_ERROR;
  }

  const auto pass = service.value()->run_blocking();
  if (pass == nullptr) {
    std::cerr << "diagnostic pass was cancelled\n";
    return EXIT_ERROR;
  }
  std::cout << service.value()->render_report(*pass, include_log);
  return exit_code_for(pass->overall_status);
}

int run_watch(std::vector<std::string> args) {
  std::string interval_text;
  const bool has_interval = take_option(args, "--interval", interval_text);
  if (!args.empty()) {
    std::cerr << "unknown argument for watch: " << args.front() << "\n";
    return EXIT_ERROR;
  }

  auto settings = load_settings();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }
  if (has_interval) {
    const auto interval = config::parse_refresh_interval(common::to_lower(interval_text));
    if (!interval.has_value()) {
      std::cerr << "invalid interval: " << interval_text << "\n";
      return EXIT_ERROR;
    }
    settings.value().refresh_interval = *interval;
  }
  settings.value().auto_refresh = settings.value().refresh_interval != config::RefreshInterval::Off;

  install_observer(settings.value());
  auto built = build_service(settings.value());
  if (!built.ok()) {
    std::cerr << built.error() << "\n";
    return EXIT_ERROR;
  }
  auto &service = *built.value();

  std::mutex output_mutex;
  service.set_pass_listener([&service, &output_mutex](const auto &pass) {
    const std::string report = service.render_report(*pass, true);
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << report << "\n" << std::flush;
  });

  std::cout << "watching (refresh " << config::refresh_interval_name(settings.value().refresh_interval)
            << "); commands: r = run now, i <off|30s|1m|2m|5m> = interval, q = quit\n";
  service.run_now();

  std::string line;
  while (std::getline(std::cin, line)) {
    const auto tokens = common::split(line, ' ');
    if (tokens.empty()) {
      continue;
    }
    const std::string command = common::to_lower(tokens.front());
    if (command == "q" || command == "quit") {
      break;
    }
    if (command == "r" || command == "run") {
      service.run_now();
      continue;
    }
    if (command == "i" || command == "interval") {
      const auto interval =
          tokens.size() > 1 ? config::parse_refresh_interval(common::to_lower(tokens[1]))
                            : std::nullopt;
      std::lock_guard<std::mutex> lock(output_mutex);
      if (!interval.has_value()) {
        std::cout << "usage: i <off|30s|1m|2m|5m>\n";
        continue;
      }
      service.set_refresh_interval(*interval);
      std::cout << "refresh interval: " << config::refresh_interval_name(*interval) << "\n";
      continue;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "unknown command: " << command << "\n";
  }

  service.stop();
  return 0;
}

int run_list() {
  auto settings = config::load_config();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }

  diag::CheckRegistry registry;
  auto registered =
      probes::register_builtin_checks(registry, settings.value(), probes::Collaborators{});
  if (!registered.ok()) {
    // Unknown ids in the file; list the defaults and flag the problem.
    std::cerr << "[WARN] " << registered.error() << "\n";
  }

  for (const auto &definition : registry.list_all()) {
    std::cout << (definition.enabled ? "[x] " : "[ ] ") << definition.id << " ("
              << diag::category_name(definition.category) << ") " << definition.display_name
              << "\n";
  }
  return 0;
}

int run_toggle(std::vector<std::string> args, const bool enable) {
  if (args.size() != 1) {
    std::cerr << "usage: linkwatch " << (enable ? "enable" : "disable") << " <check-id>\n";
    return EXIT_ERROR;
  }
  const std::string id = common::trim(args.front());
  const auto &known = config::builtin_check_ids();
  if (std::find(known.begin(), known.end(), id) == known.end()) {
    std::cerr << "unknown check id: " << id << "\n";
    return EXIT_ERROR;
  }

  auto settings = config::load_config();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }

  std::set<std::string> enabled(settings.value().enabled_checks.begin(),
                                settings.value().enabled_checks.end());
  if (enable) {
    enabled.insert(id);
  } else {
    enabled.erase(id);
  }
  settings.value().enabled_checks.clear();
  for (const auto &candidate : known) {
    if (enabled.contains(candidate)) {
      settings.value().enabled_checks.push_back(candidate);
    }
  }

  auto saved = config::save_config(settings.value());
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return EXIT_ERROR;
  }
  std::cout << id << (enable ? " enabled" : " disabled") << "\n";
  return 0;
}

int run_interval(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: linkwatch interval <off|30s|1m|2m|5m>\n";
    return EXIT_ERROR;
  }
  const auto interval = config::parse_refresh_interval(common::to_lower(args.front()));
  if (!interval.has_value()) {
    std::cerr << "invalid interval: " << args.front() << "\n";
    return EXIT_ERROR;
  }

  auto settings = config::load_config();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }
  settings.value().refresh_interval = *interval;
  settings.value().auto_refresh = *interval != config::RefreshInterval::Off;
  auto saved = config::save_config(settings.value());
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return EXIT_ERROR;
  }
  std::cout << "refresh interval: " << config::refresh_interval_name(*interval) << "\n";
  return 0;
}

int run_copy() {
  auto settings = load_settings();
  if (!settings.ok()) {
    std::cerr << settings.error() << "\n";
    return EXIT_ERROR;
  }

  install_observer(settings.value());
  auto service = build_service(settings.value());
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return EXIT_ERROR;
  }
  const auto pass = service.value()->run_blocking();
  if (pass == nullptr) {
    std::cerr << "diagnostic pass was cancelled\n";
    return EXIT_ERROR;
  }

  sinks::ClipboardSink clipboard;
  const auto copied = clipboard.write_text(service.value()->render_report(*pass, true));
  if (!copied.ok()) {
    std::cerr << copied.error() << "\n";
    return EXIT_ERROR;
  }
  std::cout << "Report copied to clipboard.\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << " - dependency chain diagnostics\n\n";
  std::cout << "usage: linkwatch [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  check [--only id,id] [--log]   Run one pass and print the report\n";
  std::cout << "                                 (exit 0 ok, 1 unknown, 2 warning, 3 critical,\n";
  std::cout << "                                 4 usage or setup error)\n";
  std::cout << "  watch [--interval I]           Re-run on an interval; r/i/q on stdin\n";
  std::cout << "  list                           Show checks and whether they are enabled\n";
  std::cout << "  enable <id> | disable <id>     Toggle a check in the config file\n";
  std::cout << "  interval <off|30s|1m|2m|5m>    Set the refresh interval\n";
  std::cout << "  copy                           Run a pass and copy the report to the clipboard\n";
  std::cout << "  config-path                    Print the config file location\n";
  std::cout << "  version                        Show version\n";
}

} // namespace

void set_collaborators_override(std::optional<probes::Collaborators> collaborators) {
  g_collaborators_override = std::move(collaborators);
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_ERROR;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return EXIT_ERROR;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "watch") {
    return run_watch(std::move(args));
  }
  if (subcommand == "list") {
    return run_list();
  }
  if (subcommand == "enable" || subcommand == "disable") {
    return run_toggle(std::move(args), subcommand == "enable");
  }
  if (subcommand == "interval") {
    return run_interval(std::move(args));
  }
  if (subcommand == "copy") {
    return run_copy();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_ERROR;
}

} // namespace linkwatch::cli
