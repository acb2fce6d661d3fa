#include "utils.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Utils {
namespace {

constexpr std::array<std::string_view, 12> kMonths = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Reads exactly `width` digits from the front of `s`
std::optional<int> take_fixed_digits(std::string_view &s, size_t width) {
  if (s.size() < width)
    return std::nullopt;
  for (size_t i = 0; i < width; ++i)
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return std::nullopt;

  auto value = string_to_number<int>(s.substr(0, width));
  s.remove_prefix(width);
  return value;
}

bool take_char(std::string_view &s, char expected) {
  if (s.empty() || s.front() != expected)
    return false;
  s.remove_prefix(1);
  return true;
}

// "dd/Mon/yyyy" prefix shared by accept dates and window start times
bool take_calendar_date(std::string_view &s, std::tm &t) {
  auto day = take_fixed_digits(s, 2);
  if (!day || !take_char(s, '/'))
    return false;

  if (s.size() < 3)
    return false;
  auto month = month_from_abbreviation(s.substr(0, 3));
  if (!month)
    return false;
  s.remove_prefix(3);

  if (!take_char(s, '/'))
    return false;
  auto year = take_fixed_digits(s, 4);
  if (!year)
    return false;

  if (*day < 1 || *day > 31)
    return false;

  t.tm_mday = *day;
  t.tm_mon = *month;
  t.tm_year = *year - 1900;
  return true;
}

// ":hh", ":mm" or ":ss" component with its upper bound
bool take_clock_field(std::string_view &s, int &out, int max_value) {
  if (!take_char(s, ':'))
    return false;
  auto value = take_fixed_digits(s, 2);
  if (!value || *value > max_value)
    return false;
  out = *value;
  return true;
}

std::optional<uint64_t> to_epoch_ms(std::tm &t, uint64_t millis) {
  const int requested_mday = t.tm_mday;

  // timegm treats the struct as UTC, which is how accept dates are compared
#if defined(_WIN32)
  std::time_t epoch_seconds = _mkgmtime(&t);
#else
  std::time_t epoch_seconds = timegm(&t);
#endif

  if (epoch_seconds < 0)
    return std::nullopt;

  // timegm normalizes 31/Feb into March; reject instead
  if (t.tm_mday != requested_mday)
    return std::nullopt;

  return static_cast<uint64_t>(epoch_seconds) * 1000 + millis;
}

} // namespace

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    std::string trimmed = trim_copy(current_token);
    if (!trimmed.empty())
      tokens.push_back(std::move(trimmed));
  }
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::optional<int> month_from_abbreviation(std::string_view month) {
  for (size_t i = 0; i < kMonths.size(); ++i)
    if (kMonths[i] == month)
      return static_cast<int>(i);
  return std::nullopt;
}

std::optional<uint64_t> convert_accept_date_to_ms(std::string_view date_str) {
  std::tm t{};
  std::string_view p = date_str;

  if (!take_calendar_date(p, t))
    return std::nullopt;
  if (!take_clock_field(p, t.tm_hour, 23) ||
      !take_clock_field(p, t.tm_min, 59) ||
      !take_clock_field(p, t.tm_sec, 59))
    return std::nullopt;

  // Fractional part: 1 to 6 digits, truncated to milliseconds
  if (!take_char(p, '.') || p.empty() || p.size() > 6)
    return std::nullopt;
  if (!std::all_of(p.begin(), p.end(),
                   [](unsigned char ch) { return std::isdigit(ch); }))
    return std::nullopt;
  auto fraction = string_to_number<uint32_t>(p);
  if (!fraction)
    return std::nullopt;

  uint64_t micros = *fraction;
  for (size_t digits = p.size(); digits < 6; ++digits)
    micros *= 10;

  return to_epoch_ms(t, micros / 1000);
}

std::optional<uint64_t> parse_start_time(std::string_view start_str) {
  std::string trimmed = trim_copy(start_str);
  std::string_view p = trimmed;
  std::tm t{};

  if (!take_calendar_date(p, t))
    return std::nullopt;

  // Hours, minutes and seconds are each optional, in that order
  if (!p.empty() && !take_clock_field(p, t.tm_hour, 23))
    return std::nullopt;
  if (!p.empty() && !take_clock_field(p, t.tm_min, 59))
    return std::nullopt;
  if (!p.empty() && !take_clock_field(p, t.tm_sec, 59))
    return std::nullopt;
  if (!p.empty())
    return std::nullopt;

  return to_epoch_ms(t, 0);
}

std::optional<uint64_t> parse_delta(std::string_view delta_str) {
  std::string trimmed = trim_copy(delta_str);
  if (trimmed.size() < 2)
    return std::nullopt;

  std::string_view digits(trimmed.data(), trimmed.size() - 1);
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) {
        return std::isdigit(ch);
      }))
    return std::nullopt;

  auto value = string_to_number<uint64_t>(digits);
  if (!value)
    return std::nullopt;

  uint64_t unit_ms = 0;
  switch (trimmed.back()) {
  case 's':
    unit_ms = 1000;
    break;
  case 'm':
    unit_ms = 60 * 1000;
    break;
  case 'h':
    unit_ms = 60 * 60 * 1000;
    break;
  case 'd':
    unit_ms = 24 * 60 * 60 * 1000;
    break;
  default:
    return std::nullopt;
  }

  if (*value > std::numeric_limits<uint64_t>::max() / unit_ms)
    return std::nullopt;
  return *value * unit_ms;
}

std::string format_accept_date(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &seconds);
#else
  gmtime_r(&seconds, &t);
#endif

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%02d/%s/%04d:%02d:%02d:%02d.%03u",
                t.tm_mday, kMonths[t.tm_mon].data(), t.tm_year + 1900,
                t.tm_hour, t.tm_min, t.tm_sec,
                static_cast<unsigned>(epoch_ms % 1000));
  return buffer;
}
} // namespace Utils
