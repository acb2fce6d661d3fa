#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *LOG_INPUT_PATH = "log_input_path";
constexpr const char *START_TIME = "start_time";
constexpr const char *DELTA = "delta";
constexpr const char *COMMANDS = "commands";
constexpr const char *OUTPUT_FORMAT = "output_format";

// Analytics Settings
constexpr const char *AN_SLOW_REQUEST_THRESHOLD_MS =
    "slow_request_threshold_ms";
constexpr const char *AN_QUEUE_PEAK_THRESHOLD = "queue_peak_threshold";
constexpr const char *AN_TOP_IPS_COUNT = "top_ips_count";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

// Thresholds the analytics commands compare against
struct AnalyticsConfig {
  int64_t slow_request_threshold_ms = 1000;
  int64_t queue_peak_threshold = 1;
  size_t top_ips_count = 10;
};

struct AppConfig {
  std::string log_input_path;

  // Time window, both in the command-line formats ("11/Dec/2013:19:31:41",
  // "30m"); empty means unset
  std::string start_time;
  std::string delta;

  std::vector<std::string> commands;
  std::string output_format = "text";

  AnalyticsConfig analytics;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);
void apply_default_log_levels(LoggingConfig &config);

// Validation functions for configuration parameters
bool validate_analytics_config(const AnalyticsConfig &config,
                               std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
