#ifndef TEXT_FORMATTER_HPP
#define TEXT_FORMATTER_HPP

#include "analysis/command_registry.hpp"

#include <string>

namespace TextFormatter {

// Human readable block: the command name, an underline, then the result.
// Histograms are listed by count, highest first.
std::string format_command_result(const std::string &name,
                                  const CommandResult &result);

} // namespace TextFormatter

#endif // TEXT_FORMATTER_HPP
