#ifndef BASE_LOG_READER_HPP
#define BASE_LOG_READER_HPP

#include <string>
#include <vector>

class ILogReader {
public:
  virtual ~ILogReader() = default;

  // Fetches the next batch of raw log lines, in source order
  // The definition of a "batch" is implementation-specific
  // Returns an empty vector once the source is exhausted
  virtual std::vector<std::string> get_next_batch() = 0;
};

#endif // BASE_LOG_READER_HPP
