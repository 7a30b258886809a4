#pragma once
#include <string_view>

namespace tc {

enum class LogLevel { Off = 0, Error = 1, Debug = 2 };

// Threshold is read once from TC_LOG (off|error|debug) unless set explicitly.
LogLevel log_level() noexcept;
void set_log_level(LogLevel lvl) noexcept;
bool log_enabled(LogLevel lvl) noexcept;

// Writes "[tag] message" to stderr when `lvl` passes the threshold.
void log(LogLevel lvl, std::string_view tag, std::string_view message);

}
