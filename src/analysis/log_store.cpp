#include "log_store.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

LogStore::LogStore(std::shared_ptr<ILogReader> source,
                   std::optional<uint64_t> start_time_ms,
                   std::optional<uint64_t> delta_ms)
    : source_(std::move(source)), start_time_ms_(start_time_ms) {
  // A window running past the representable range is open-ended
  if (start_time_ms_ && delta_ms)
    end_time_ms_ =
        *delta_ms > std::numeric_limits<uint64_t>::max() - *start_time_ms_
            ? std::numeric_limits<uint64_t>::max()
            : *start_time_ms_ + *delta_ms;
}

void LogStore::ingest() {
  if (!source_) {
    LOG(LogLevel::FATAL, LogComponent::STORE_INGEST,
        "No log source is configured; nothing to ingest.");
    throw ConfigurationError("No log source is configured yet");
  }
  if (ingested_)
    throw std::logic_error("LogStore already ingested its source");

  if (start_time_ms_)
    LOG(LogLevel::INFO, LogComponent::STORE_WINDOW,
        "Restricting analysis to accept dates from "
            << Utils::format_accept_date(*start_time_ms_) << " to "
            << (end_time_ms_ ? Utils::format_accept_date(*end_time_ms_)
                             : std::string("end of log")));

  for (std::vector<std::string> batch = source_->get_next_batch();
       !batch.empty(); batch = source_->get_next_batch()) {
    for (auto &raw_line : batch) {
      total_lines_++;
      Utils::trim_inplace(raw_line);

      auto entry_opt = LogEntry::parse_from_string(raw_line, total_lines_);
      if (!entry_opt) {
        LOG(LogLevel::DEBUG, LogComponent::STORE_INGEST,
            "Invalid line " << total_lines_ << ": " << raw_line);
        invalid_lines_.push_back(std::move(raw_line));
      } else if (is_in_time_range(*entry_opt)) {
        valid_entries_.push_back(std::move(*entry_opt));
      } else {
        window_dropped_++;
        LOG(LogLevel::TRACE, LogComponent::STORE_WINDOW,
            "Line " << total_lines_ << " outside the time window ("
                    << entry_opt->raw_accept_date << ")");
      }
    }
  }

  sort_entries();
  ingested_ = true;

  LOG(LogLevel::INFO, LogComponent::STORE_INGEST,
      "Ingestion finished. Total: " << total_lines_
                                    << ", valid: " << valid_entries_.size()
                                    << ", invalid: " << invalid_lines_.size()
                                    << ", outside window: " << window_dropped_);
}

bool LogStore::is_in_time_range(const LogEntry &entry) const {
  if (!start_time_ms_)
    return true;
  if (entry.accept_date_ms < *start_time_ms_)
    return false;

  if (!end_time_ms_)
    return true;
  return entry.accept_date_ms <= *end_time_ms_;
}

// HAProxy logs a connection once it completes, so file order is completion
// order. Sorting by accept date restores the order connections arrived in.
void LogStore::sort_entries() {
  std::stable_sort(valid_entries_.begin(), valid_entries_.end(),
                   [](const LogEntry &a, const LogEntry &b) {
                     return a.accept_date_ms < b.accept_date_ms;
                   });
}
