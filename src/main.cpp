#include "analysis/analytics_commands.hpp"
#include "analysis/command_registry.hpp"
#include "analysis/log_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "io/log_readers/base_log_reader.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "utils/json_formatter.hpp"
#include "utils/text_formatter.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char *kVersion = "1.0";

void print_usage(std::ostream &os) {
  os << "Usage:\n"
     << "  haplog [-c CONFIG] [-l LOGFILE] [-s START] [-d DELTA]\n"
     << "         [--command NAME[,NAME...]] [--json] [--list-commands]\n"
     << "\n"
     << "Options:\n"
     << "  -c, --config PATH     INI configuration file.\n"
     << "  -l, --log PATH        HAProxy log file to analyze.\n"
     << "  -s, --start DATE      Only look at requests accepted from DATE on\n"
     << "                        (11/Dec/2013 or 11/Dec/2013:19:31:41).\n"
     << "  -d, --delta DELTA     Length of the window that starts at --start\n"
     << "                        (30s, 5m, 3h, 1d).\n"
     << "  --command LIST        Comma-separated commands to run; may repeat.\n"
     << "  --json                Print results as a single JSON object.\n"
     << "  --list-commands       Print the available commands and exit.\n"
     << "  -h, --help            Print this help.\n"
     << "  --version             Print version.\n";
}

struct CliOptions {
  std::string config_path;
  std::optional<std::string> log_path;
  std::optional<std::string> start_time;
  std::optional<std::string> delta;
  std::vector<std::string> commands;
  bool json = false;
  bool list_commands = false;
  bool help = false;
  bool version = false;
};

// Returns std::nullopt after reporting the problem on stderr
std::optional<CliOptions> parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--version") {
      options.version = true;
    } else if (arg == "--json") {
      options.json = true;
    } else if (arg == "--list-commands") {
      options.list_commands = true;
    } else if (arg == "-c" || arg == "--config") {
      auto value = take_value();
      if (!value)
        return std::nullopt;
      options.config_path = *value;
    } else if (arg == "-l" || arg == "--log") {
      auto value = take_value();
      if (!value)
        return std::nullopt;
      options.log_path = *value;
    } else if (arg == "-s" || arg == "--start") {
      auto value = take_value();
      if (!value)
        return std::nullopt;
      options.start_time = *value;
    } else if (arg == "-d" || arg == "--delta") {
      auto value = take_value();
      if (!value)
        return std::nullopt;
      options.delta = *value;
    } else if (arg == "--command") {
      auto value = take_value();
      if (!value)
        return std::nullopt;
      for (auto &name : Utils::split_string(*value, ','))
        options.commands.push_back(std::move(name));
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }

  return options;
}

// Config file first, command line on top of it
std::optional<Config::AppConfig> resolve_configuration(const CliOptions &cli) {
  Config::AppConfig config;

  if (!cli.config_path.empty()) {
    Config::ConfigManager manager;
    if (!manager.load_configuration(cli.config_path))
      return std::nullopt;
    config = *manager.get_config();
  } else {
    Config::apply_default_log_levels(config.logging);
  }

  if (cli.log_path)
    config.log_input_path = *cli.log_path;
  if (cli.start_time)
    config.start_time = *cli.start_time;
  if (cli.delta)
    config.delta = *cli.delta;
  if (!cli.commands.empty())
    config.commands = cli.commands;
  if (cli.json)
    config.output_format = "json";

  std::vector<std::string> errors;
  if (!Config::validate_app_config(config, errors)) {
    for (const auto &error : errors)
      std::cerr << "Configuration error: " << error << "\n";
    return std::nullopt;
  }

  return config;
}

} // namespace

int main(int argc, char *argv[]) {
  auto cli = parse_arguments(argc, argv);
  if (!cli) {
    print_usage(std::cerr);
    return 1;
  }
  if (cli->help) {
    print_usage(std::cout);
    return 0;
  }
  if (cli->version) {
    std::cout << "haplog v" << kVersion << "\n";
    return 0;
  }

  const CommandRegistry &registry = CommandRegistry::instance();
  if (cli->list_commands) {
    for (const auto &name : registry.names())
      std::cout << name << "\n";
    return 0;
  }

  auto config = resolve_configuration(*cli);
  if (!config)
    return 1;

  LogManager::instance().configure(config->logging);

  if (config->commands.empty()) {
    LOG(LogLevel::ERROR, LogComponent::CLI,
        "No command given. Use --command or --list-commands.");
    print_usage(std::cerr);
    return 1;
  }
  for (const auto &name : config->commands) {
    if (!registry.contains(name)) {
      LOG(LogLevel::ERROR, LogComponent::CLI,
          "Unknown command '" << name
                              << "'. Use --list-commands to see them all.");
      return 1;
    }
  }

  try {
    std::shared_ptr<ILogReader> reader;
    if (!config->log_input_path.empty())
      reader = std::make_shared<FileLogReader>(config->log_input_path);

    std::optional<uint64_t> start_time_ms;
    std::optional<uint64_t> delta_ms;
    if (!config->start_time.empty())
      start_time_ms = Utils::parse_start_time(config->start_time);
    if (!config->delta.empty())
      delta_ms = Utils::parse_delta(config->delta);
    if (delta_ms && !start_time_ms)
      LOG(LogLevel::WARN, LogComponent::CLI,
          "A delta without a start time is ignored.");

    LogStore store(reader, start_time_ms, delta_ms);
    store.ingest();

    AnalyticsCommands commands(store, config->analytics);

    std::vector<std::pair<std::string, CommandResult>> results;
    results.reserve(config->commands.size());
    for (const auto &name : config->commands)
      results.emplace_back(name, registry.run(name, commands));

    if (config->output_format == "json") {
      std::cout << JsonFormatter::format_results_to_json(results) << "\n";
    } else {
      for (const auto &[name, result] : results)
        std::cout << TextFormatter::format_command_result(name, result)
                  << "\n";
    }
  } catch (const ConfigurationError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Configuration error: " << e.what() << ". Use -l to give a log file.");
    return 1;
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Run failed: " << e.what());
    return 1;
  }

  return 0;
}
