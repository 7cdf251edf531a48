#include "textguard/cli/commands.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/strings.hpp"
#include "textguard/config/config.hpp"
#include "textguard/detect/types.hpp"
#include "textguard/engine/engine.hpp"
#include "textguard/engine/report.hpp"
#include "textguard/observability/factory.hpp"
#include "textguard/observability/global.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace textguard::cli {

namespace {

constexpr int EXIT_THREAT = 2;

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
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
      config::set_config_path_override(std::filesystem::path(args[i + 1]));
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(value));
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

// Text comes from --file, from stdin ("-" or no arguments), or from the remaining words.
common::Result<std::string> read_input(std::vector<std::string> &args) {
  std::string file;
  if (take_option(args, "--file", "-f", file)) {
    return common::read_text_file(common::expand_path(file));
  }
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    return common::Result<std::string>::success(read_stdin_all());
  }
  return common::Result<std::string>::success(common::join(args, " "));
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  const auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    return common::Result<config::Config>::failure(validation.error(), validation.code());
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value().observability));
  return cfg;
}

int report_failure(const std::string &component, const common::Status &status) {
  if (!common::is_input_error(status.code())) {
    observability::record_error(component, status.error());
  }
  std::cerr << status.error() << "\n";
  observability::flush_global_observer();
  return 1;
}

int run_scan(std::vector<std::string> args) {
  std::string fail_on_name;
  std::optional<detect::ThreatLevel> fail_on;
  if (take_option(args, "--fail-on", "", fail_on_name)) {
    fail_on = detect::parse_threat_level(common::to_lower(fail_on_name));
    if (!fail_on.has_value()) {
      std::cerr << "unknown threat level: " << fail_on_name << "\n";
      return 1;
    }
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto text = read_input(args);
  if (!text.ok()) {
    return report_failure("cli", common::Status::error(text.error(), text.code()));
  }

  const engine::Engine scanner(cfg.value().scanner);
  auto result = scanner.scan(text.value());
  if (!result.ok()) {
    return report_failure("engine", common::Status::error(result.error(), result.code()));
  }
  std::cout << engine::scan_result_json(result.value()) << "\n";
  observability::flush_global_observer();

  if (fail_on.has_value() && result.value().threat_level != detect::ThreatLevel::Safe &&
      result.value().threat_level >= *fail_on) {
    return EXIT_THREAT;
  }
  return 0;
}

int run_clean(std::vector<std::string> args) {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto text = read_input(args);
  if (!text.ok()) {
    return report_failure("cli", common::Status::error(text.error(), text.code()));
  }

  const engine::Engine cleaner(cfg.value().scanner);
  auto result = cleaner.clean(text.value());
  if (!result.ok()) {
    return report_failure("engine", common::Status::error(result.error(), result.code()));
  }
  std::cout << engine::clean_result_json(result.value()) << "\n";
  observability::flush_global_observer();
  return 0;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    if (!config::config_exists()) {
      std::cout << "# no config file found; showing defaults\n";
    }
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: textguard config get <key>\n";
      return 1;
    }
    auto value = config::get_config_value(cfg.value(), args[1]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    std::cout << value.value() << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: textguard config set <key> <value>\n";
      return 1;
    }
    const auto updated = config::set_config_value(cfg.value(), args[1], args[2]);
    if (!updated.ok()) {
      std::cerr << updated.error() << "\n";
      return 1;
    }
    const auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      std::cerr << validation.error() << "\n";
      return 1;
    }
    const auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  if (args[0] == "validate") {
    const auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      std::cerr << validation.error() << "\n";
      return 1;
    }
    for (const auto &warning : validation.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

std::string version_string() {
#ifdef TEXTGUARD_VERSION
  const std::string version = TEXTGUARD_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "textguard " + version;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: textguard [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  scan [TEXT...|--file PATH|-]   Report hidden or adversarial content as JSON\n";
  std::cout << "       --fail-on LEVEL           Exit 2 when the threat level reaches LEVEL\n";
  std::cout << "  clean [TEXT...|--file PATH|-]  Print a sanitized copy of the text as JSON\n";
  std::cout << "  techniques                     List the detected techniques\n";
  std::cout << "  config show|get|set|validate   Inspect or edit the configuration\n";
  std::cout << "  config-path                    Print the configuration file path\n";
  std::cout << "  version                        Show version\n";
  std::cout << "  help                           Show this help\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
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
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args));
  }
  if (subcommand == "clean") {
    return run_clean(std::move(args));
  }
  if (subcommand == "techniques") {
    std::cout << engine::techniques_json(engine::techniques()) << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace textguard::cli
