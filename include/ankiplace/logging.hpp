#pragma once

#include <string_view>

namespace ankiplace {

/*
 * Line-oriented console logging: "[Tag] message".
 * Lines from concurrent threads never interleave.
 * info goes to stdout, warn and error to stderr.
 */
void log_info(std::string_view tag, std::string_view message);
void log_warn(std::string_view tag, std::string_view message);
void log_error(std::string_view tag, std::string_view message);

} // namespace ankiplace
