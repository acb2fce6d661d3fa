#ifndef ANALYTICS_COMMANDS_HPP
#define ANALYTICS_COMMANDS_HPP

#include "analysis/log_store.hpp"
#include "core/config.hpp"
#include "core/log_entry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

using StringHistogram = std::unordered_map<std::string, uint64_t>;
using StatusCodeHistogram = std::unordered_map<int, uint64_t>;

struct TopIpEntry {
  std::string ip;
  uint64_t repetitions;
};

// A run of requests that waited in the backend queue. Runs that stay at or
// below the threshold are not reported and fold into the next one.
struct QueuePeak {
  int peak;           // deepest queue seen in the run
  size_t span;        // requests in the run that were queued
  uint64_t first_ms;  // accept date of the first queued request
  uint64_t last_ms;   // accept date of the request that closed the run
};

// Read-only queries over a LogStore whose ingestion has completed. Every
// query is independent of the others and may be called in any order.
class AnalyticsCommands {
public:
  explicit AnalyticsCommands(const LogStore &store,
                             Config::AnalyticsConfig config = {});

  uint64_t counter() const;
  uint64_t counter_invalid() const;

  StringHistogram http_methods() const;
  StatusCodeHistogram status_codes_counter() const;
  StringHistogram request_path_counter() const;
  StringHistogram server_load() const;

  // Needs HAProxy to capture exactly one request header, the one carrying
  // the forwarded client address (usually X-Forwarded-For). Entries without
  // captured headers are skipped.
  StringHistogram ip_counter() const;

  // Response times (Tr) above the slow request threshold, chronological
  std::vector<int64_t> slow_requests() const;

  std::vector<TopIpEntry> top_ips() const;
  std::vector<QueuePeak> queue_peaks() const;

  // Exact bounded selection of the `count` most repeated keys, O(count)
  // extra memory. A key only displaces the current minimum when its count is
  // strictly greater. Result is ordered by repetitions, descending.
  static std::vector<TopIpEntry> select_top(const StringHistogram &histogram,
                                            size_t count);

  // Single forward pass over chronologically ordered entries
  static std::vector<QueuePeak>
  detect_queue_peaks(const std::vector<LogEntry> &entries, int64_t threshold);

  const Config::AnalyticsConfig &config() const { return config_; }

private:
  const LogStore &store_;
  Config::AnalyticsConfig config_;
};

#endif // ANALYTICS_COMMANDS_HPP
