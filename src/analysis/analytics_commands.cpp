#include "analytics_commands.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace {

template <typename Key>
void increment(std::unordered_map<Key, uint64_t> &histogram, const Key &key) {
  ++histogram.try_emplace(key, 0).first->second;
}

template <typename Key, typename Extract>
std::unordered_map<Key, uint64_t>
build_histogram(const std::vector<LogEntry> &entries, Extract extract) {
  std::unordered_map<Key, uint64_t> histogram;
  for (const auto &entry : entries)
    increment<Key>(histogram, extract(entry));
  return histogram;
}

} // namespace

AnalyticsCommands::AnalyticsCommands(const LogStore &store,
                                     Config::AnalyticsConfig config)
    : store_(store), config_(config) {
  if (!store_.ingested())
    LOG(LogLevel::WARN, LogComponent::ANALYTICS_COMMANDS,
        "Analytics created over a store that has not been ingested; all "
        "results will be empty.");
}

uint64_t AnalyticsCommands::counter() const {
  return store_.valid_entries().size();
}

uint64_t AnalyticsCommands::counter_invalid() const {
  return store_.counter_of_invalid_lines();
}

StringHistogram AnalyticsCommands::http_methods() const {
  return build_histogram<std::string>(
      store_.valid_entries(),
      [](const LogEntry &entry) { return entry.http_request_method; });
}

StatusCodeHistogram AnalyticsCommands::status_codes_counter() const {
  return build_histogram<int>(
      store_.valid_entries(),
      [](const LogEntry &entry) { return entry.status_code; });
}

StringHistogram AnalyticsCommands::request_path_counter() const {
  return build_histogram<std::string>(
      store_.valid_entries(),
      [](const LogEntry &entry) { return entry.http_request_path; });
}

StringHistogram AnalyticsCommands::server_load() const {
  return build_histogram<std::string>(
      store_.valid_entries(),
      [](const LogEntry &entry) { return entry.server_name; });
}

StringHistogram AnalyticsCommands::ip_counter() const {
  StringHistogram ips;
  for (const auto &entry : store_.valid_entries()) {
    if (!entry.captured_request_headers)
      continue;

    const std::string &headers = *entry.captured_request_headers;
    std::string ip =
        headers.size() >= 2 ? headers.substr(1, headers.size() - 2) : "";
    increment(ips, ip);
  }
  return ips;
}

std::vector<int64_t> AnalyticsCommands::slow_requests() const {
  std::vector<int64_t> slow;
  for (const auto &entry : store_.valid_entries())
    if (entry.time_wait_response > config_.slow_request_threshold_ms)
      slow.push_back(entry.time_wait_response);
  return slow;
}

std::vector<TopIpEntry> AnalyticsCommands::top_ips() const {
  return select_top(ip_counter(), config_.top_ips_count);
}

std::vector<QueuePeak> AnalyticsCommands::queue_peaks() const {
  return detect_queue_peaks(store_.valid_entries(),
                            config_.queue_peak_threshold);
}

std::vector<TopIpEntry>
AnalyticsCommands::select_top(const StringHistogram &histogram, size_t count) {
  if (count == 0)
    return {};

  // Min-heap on repetitions: the root is always the weakest candidate
  auto weaker = [](const TopIpEntry &a, const TopIpEntry &b) {
    return a.repetitions > b.repetitions;
  };
  std::priority_queue<TopIpEntry, std::vector<TopIpEntry>, decltype(weaker)>
      candidates(weaker);

  for (const auto &[ip, repetitions] : histogram) {
    if (candidates.size() < count)
      candidates.push({ip, repetitions});
    else if (repetitions > candidates.top().repetitions) {
      candidates.pop();
      candidates.push({ip, repetitions});
    }
  }

  std::vector<TopIpEntry> top;
  top.reserve(candidates.size());
  while (!candidates.empty()) {
    top.push_back(candidates.top());
    candidates.pop();
  }

  std::sort(top.begin(), top.end(),
            [](const TopIpEntry &a, const TopIpEntry &b) {
              if (a.repetitions != b.repetitions)
                return a.repetitions > b.repetitions;
              return a.ip < b.ip;
            });
  return top;
}

std::vector<QueuePeak>
AnalyticsCommands::detect_queue_peaks(const std::vector<LogEntry> &entries,
                                      int64_t threshold) {
  std::vector<QueuePeak> peaks;

  int current_peak = 0;
  size_t current_span = 0;
  std::optional<uint64_t> first_on_queue;

  for (const auto &entry : entries) {
    const int queue = entry.queue_backend;

    if (queue > 0) {
      current_span++;
      if (!first_on_queue)
        first_on_queue = entry.accept_date_ms;
    } else if (current_peak > threshold && first_on_queue) {
      // The run closes on the first unqueued request after it. Runs that
      // never went above the threshold are not reset and carry their span
      // and first queued time into the next run.
      peaks.push_back(
          {current_peak, current_span, *first_on_queue, entry.accept_date_ms});
      current_peak = 0;
      current_span = 0;
      first_on_queue.reset();
    }

    current_peak = std::max(current_peak, queue);
  }

  // A run still open when the log ends closes on the last entry
  if (!entries.empty() && entries.back().queue_backend > 0 &&
      current_peak > threshold)
    peaks.push_back({current_peak, current_span, *first_on_queue,
                     entries.back().accept_date_ms});

  LOG(LogLevel::DEBUG, LogComponent::ANALYTICS_COMMANDS,
      "Detected " << peaks.size() << " queue peaks above " << threshold);
  return peaks;
}
