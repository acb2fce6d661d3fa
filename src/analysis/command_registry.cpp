#include "command_registry.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::map<std::string, CommandFunction> build_command_table() {
  return {
      {"counter",
       [](const AnalyticsCommands &c) -> CommandResult { return c.counter(); }},
      {"counter_invalid",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.counter_invalid();
       }},
      {"http_methods",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.http_methods();
       }},
      {"ip_counter",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.ip_counter();
       }},
      {"queue_peaks",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.queue_peaks();
       }},
      {"request_path_counter",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.request_path_counter();
       }},
      {"server_load",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.server_load();
       }},
      {"slow_requests",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.slow_requests();
       }},
      {"status_codes_counter",
       [](const AnalyticsCommands &c) -> CommandResult {
         return c.status_codes_counter();
       }},
      {"top_ips",
       [](const AnalyticsCommands &c) -> CommandResult { return c.top_ips(); }},
  };
}

} // namespace

CommandRegistry::CommandRegistry() : commands_(build_command_table()) {}

std::vector<std::string> CommandRegistry::names() const {
  std::vector<std::string> names;
  names.reserve(commands_.size());
  for (const auto &pair : commands_)
    names.push_back(pair.first);
  return names;
}

bool CommandRegistry::contains(const std::string &name) const {
  return commands_.find(name) != commands_.end();
}

CommandResult CommandRegistry::run(const std::string &name,
                                   const AnalyticsCommands &commands) const {
  auto it = commands_.find(name);
  if (it == commands_.end())
    throw std::out_of_range("Unknown command: " + name);

  LOG(LogLevel::DEBUG, LogComponent::ANALYTICS_COMMANDS,
      "Running command " << name);
  return it->second(commands);
}
