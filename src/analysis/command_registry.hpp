#ifndef COMMAND_REGISTRY_HPP
#define COMMAND_REGISTRY_HPP

#include "analysis/analytics_commands.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

// Every shape an analytics command can answer with
using CommandResult =
    std::variant<uint64_t, StringHistogram, StatusCodeHistogram,
                 std::vector<int64_t>, std::vector<TopIpEntry>,
                 std::vector<QueuePeak>>;

using CommandFunction =
    std::function<CommandResult(const AnalyticsCommands &)>;

// Static table from command name to the query it runs. Built once, never
// modified afterwards.
class CommandRegistry {
public:
  static const CommandRegistry &instance() {
    static const CommandRegistry instance;
    return instance;
  }

  // Sorted alphabetically
  std::vector<std::string> names() const;
  bool contains(const std::string &name) const;

  // Throws std::out_of_range for an unknown name
  CommandResult run(const std::string &name,
                    const AnalyticsCommands &commands) const;

private:
  CommandRegistry();
  const std::map<std::string, CommandFunction> commands_;
};

#endif // COMMAND_REGISTRY_HPP
