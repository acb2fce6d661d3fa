#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>
#include <type_traits>
#include <variant>

nlohmann::json JsonFormatter::command_result_to_json(const CommandResult &result) {
  return std::visit(
      [](const auto &value) -> nlohmann::json {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, uint64_t>) {
          return value;
        } else if constexpr (std::is_same_v<T, StringHistogram>) {
          nlohmann::json j = nlohmann::json::object();
          for (const auto &[key, count] : value)
            j[key] = count;
          return j;
        } else if constexpr (std::is_same_v<T, StatusCodeHistogram>) {
          // JSON keys are strings; status codes become "200", "404", ...
          nlohmann::json j = nlohmann::json::object();
          for (const auto &[code, count] : value)
            j[std::to_string(code)] = count;
          return j;
        } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
          return nlohmann::json(value);
        } else if constexpr (std::is_same_v<T, std::vector<TopIpEntry>>) {
          nlohmann::json j = nlohmann::json::array();
          for (const auto &entry : value)
            j.push_back(nlohmann::json{{"ip", entry.ip},
                                       {"repetitions", entry.repetitions}});
          return j;
        } else {
          static_assert(std::is_same_v<T, std::vector<QueuePeak>>,
                        "unhandled command result type");
          nlohmann::json j = nlohmann::json::array();
          for (const auto &peak : value)
            j.push_back(nlohmann::json{
                {"peak", peak.peak},
                {"span", peak.span},
                {"first", Utils::format_accept_date(peak.first_ms)},
                {"last", Utils::format_accept_date(peak.last_ms)}});
          return j;
        }
      },
      result);
}

std::string JsonFormatter::format_results_to_json(
    const std::vector<std::pair<std::string, CommandResult>> &named_results,
    int indent) {
  // ordered_json keeps the commands in the order they were requested
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto &[name, result] : named_results)
    j[name] = command_result_to_json(result);
  return j.dump(indent);
}
