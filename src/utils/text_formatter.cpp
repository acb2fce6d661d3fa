#include "text_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

template <typename Key>
std::vector<std::pair<Key, uint64_t>>
sorted_by_count(const std::unordered_map<Key, uint64_t> &histogram) {
  std::vector<std::pair<Key, uint64_t>> rows(histogram.begin(),
                                             histogram.end());
  std::sort(rows.begin(), rows.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second)
      return a.second > b.second;
    return a.first < b.first;
  });
  return rows;
}

} // namespace

std::string TextFormatter::format_command_result(const std::string &name,
                                                 const CommandResult &result) {
  std::ostringstream out;
  out << name << "\n" << std::string(name.size(), '=') << "\n";

  std::visit(
      [&out](const auto &value) {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, uint64_t>) {
          out << value << "\n";
        } else if constexpr (std::is_same_v<T, StringHistogram> ||
                             std::is_same_v<T, StatusCodeHistogram>) {
          for (const auto &[key, count] : sorted_by_count(value))
            out << "- " << key << ": " << count << "\n";
        } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
          for (int64_t ms : value)
            out << "- " << ms << " ms\n";
        } else if constexpr (std::is_same_v<T, std::vector<TopIpEntry>>) {
          for (const auto &entry : value)
            out << "- " << entry.ip << ": " << entry.repetitions << "\n";
        } else {
          for (const auto &peak : value)
            out << "- peak: " << peak.peak << ", span: " << peak.span
                << ", first: " << Utils::format_accept_date(peak.first_ms)
                << ", last: " << Utils::format_accept_date(peak.last_ms)
                << "\n";
        }
      },
      result);

  return out.str();
}
