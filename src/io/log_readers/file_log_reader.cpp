#include "file_log_reader.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

FileLogReader::FileLogReader(const std::string &filepath) {
  log_file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open log source file: " << filepath);
    throw std::runtime_error("Failed to open log source file: " + filepath);
  } else
    LOG(LogLevel::INFO, LogComponent::IO_READER,
        "Successfully opened log file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileLogReader closed. Total lines read: " << line_number_);
}

bool FileLogReader::is_open() const { return log_file_stream_.is_open(); }

std::vector<std::string> FileLogReader::get_next_batch() {
  std::vector<std::string> batch;
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Log file is not open. Cannot read next batch.");
    return batch;
  }

  batch.reserve(BATCH_SIZE);
  std::string line;

  // Blank lines are passed through; they count as (invalid) lines read
  while (batch.size() < BATCH_SIZE && std::getline(log_file_stream_, line)) {
    line_number_++;
    batch.push_back(std::move(line));
  }

  LOG(LogLevel::TRACE, LogComponent::IO_READER,
      "Read " << batch.size() << " raw lines from file at line number "
              << line_number_);

  return batch;
}
