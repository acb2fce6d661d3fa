#ifndef LOG_STORE_HPP
#define LOG_STORE_HPP

#include "core/log_entry.hpp"
#include "io/log_readers/base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when ingestion is requested without a data source
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &what)
      : std::runtime_error(what) {}
};

// Owns one ingestion run: the valid/invalid partition of the source lines,
// the optional accept-time window and the chronological resequencing.
//
// Lifecycle: construct, call ingest() once, then read. A new run needs a new
// instance. Before ingest() every accessor reports empty collections.
class LogStore {
public:
  // `delta_ms` only takes effect together with `start_time_ms`
  explicit LogStore(std::shared_ptr<ILogReader> source,
                    std::optional<uint64_t> start_time_ms = std::nullopt,
                    std::optional<uint64_t> delta_ms = std::nullopt);

  // Throws ConfigurationError when no source is configured, and
  // std::logic_error on a second call
  void ingest();

  bool is_in_time_range(const LogEntry &entry) const;

  bool ingested() const { return ingested_; }
  uint64_t total_lines() const { return total_lines_; }
  size_t counter_of_invalid_lines() const { return invalid_lines_.size(); }
  size_t counter_of_window_dropped_lines() const { return window_dropped_; }

  // Sorted by accept date, ascending; ties keep file order
  const std::vector<LogEntry> &valid_entries() const { return valid_entries_; }
  // Stripped raw text, in file order
  const std::vector<std::string> &invalid_lines() const {
    return invalid_lines_;
  }

  const std::optional<uint64_t> &start_time_ms() const {
    return start_time_ms_;
  }
  const std::optional<uint64_t> &end_time_ms() const { return end_time_ms_; }

private:
  void sort_entries();

  std::shared_ptr<ILogReader> source_;
  std::optional<uint64_t> start_time_ms_;
  std::optional<uint64_t> end_time_ms_;

  bool ingested_ = false;
  uint64_t total_lines_ = 0;
  size_t window_dropped_ = 0;
  std::vector<LogEntry> valid_entries_;
  std::vector<std::string> invalid_lines_;
};

#endif // LOG_STORE_HPP
