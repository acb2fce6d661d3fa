#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);

// HAProxy accept date, e.g. "09/Dec/2013:12:59:46.633" (UTC, ms precision)
std::optional<uint64_t> convert_accept_date_to_ms(std::string_view date_str);

// Window start as given on the command line: "11/Dec/2013" or
// "11/Dec/2013:19:31:41"
std::optional<uint64_t> parse_start_time(std::string_view start_str);

// Window length: a positive integer followed by one of s, m, h, d
std::optional<uint64_t> parse_delta(std::string_view delta_str);

// Inverse of convert_accept_date_to_ms
std::string format_accept_date(uint64_t epoch_ms);

std::optional<int> month_from_abbreviation(std::string_view month);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  // HAProxy prefixes some values with '+' when they were truncated
  if (s.front() == '+')
    s.remove_prefix(1);

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
