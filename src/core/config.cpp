#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"cli", LogComponent::CLI},
    {"io.reader", LogComponent::IO_READER},
    {"store.ingest", LogComponent::STORE_INGEST},
    {"store.window", LogComponent::STORE_WINDOW},
    {"analytics.commands", LogComponent::ANALYTICS_COMMANDS}};

// Leaves `target` untouched when the value is not a number of type T
template <typename T>
void assign_number(const std::string &key, const std::string &value,
                   int line_num, T &target) {
  if (auto parsed = Utils::string_to_number<T>(value)) {
    target = *parsed;
    return;
  }
  std::cerr << "Warning (Config Line " << line_num
            << "): Invalid value for key '" << key << "': '" << value
            << "'. Keeping " << target << "." << std::endl;
}

void apply_default_log_levels(LoggingConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    config.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool validate_analytics_config(const AnalyticsConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (config.slow_request_threshold_ms < 0) {
    errors.push_back("Slow request threshold must not be negative");
    valid = false;
  }

  if (config.queue_peak_threshold < 0) {
    errors.push_back("Queue peak threshold must not be negative");
    valid = false;
  }

  if (config.top_ips_count < 1) {
    errors.push_back("Top IPs count must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_analytics_config(config.analytics, errors))
    valid = false;

  if (config.output_format != "text" && config.output_format != "json") {
    errors.push_back("Output format must be 'text' or 'json', got '" +
                     config.output_format + "'");
    valid = false;
  }

  if (!config.start_time.empty() &&
      !Utils::parse_start_time(config.start_time)) {
    errors.push_back("Start time '" + config.start_time +
                     "' is not in dd/Mon/yyyy[:hh[:mm[:ss]]] format");
    valid = false;
  }

  if (!config.delta.empty() && !Utils::parse_delta(config.delta)) {
    errors.push_back("Delta '" + config.delta +
                     "' must be a number followed by s, m, h or d");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cerr << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::LOG_INPUT_PATH)
        config.log_input_path = value;
      else if (key == Keys::START_TIME)
        config.start_time = value;
      else if (key == Keys::DELTA)
        config.delta = value;
      else if (key == Keys::COMMANDS)
        config.commands = Utils::split_string(value, ',');
      else if (key == Keys::OUTPUT_FORMAT)
        config.output_format = value;
      else
        config.custom_settings[key] = value;

      // Analytics thresholds
    } else if (current_section == "Analytics") {
      if (key == Keys::AN_SLOW_REQUEST_THRESHOLD_MS)
        assign_number(key, value, line_num,
                      config.analytics.slow_request_threshold_ms);
      else if (key == Keys::AN_QUEUE_PEAK_THRESHOLD)
        assign_number(key, value, line_num,
                      config.analytics.queue_peak_threshold);
      else if (key == Keys::AN_TOP_IPS_COUNT)
        assign_number(key, value, line_num, config.analytics.top_ips_count);
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown analytics key '" << key << "'" << std::endl;

      // Logging Settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "store.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Unknown section '" << current_section << "'"
                << std::endl;
    }
  }

  config_file.close();
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cerr << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
