#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/command_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace JsonFormatter {

nlohmann::json command_result_to_json(const CommandResult &result);

// One object keyed by command name, in the order the commands were run
std::string
format_results_to_json(const std::vector<std::pair<std::string, CommandResult>>
                           &named_results,
                       int indent = 2);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
