#ifndef MEMORY_LOG_READER_HPP
#define MEMORY_LOG_READER_HPP

#include "base_log_reader.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Serves lines that are already in memory, in the given order
class MemoryLogReader : public ILogReader {
public:
  explicit MemoryLogReader(std::vector<std::string> lines,
                           size_t batch_size = 1000)
      : lines_(std::move(lines)), batch_size_(std::max<size_t>(batch_size, 1)) {
  }

  std::vector<std::string> get_next_batch() override {
    size_t end = std::min(position_ + batch_size_, lines_.size());
    std::vector<std::string> batch(lines_.begin() + position_,
                                   lines_.begin() + end);
    position_ = end;
    return batch;
  }

private:
  std::vector<std::string> lines_;
  size_t batch_size_;
  size_t position_ = 0;
};

#endif // MEMORY_LOG_READER_HPP
