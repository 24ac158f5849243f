// Console logging helpers shared by every LinkShare module.
#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace linkshare {

// Current local time as HH:MM:SS
std::string now_hms();

// True when LINKSHARE_DEBUG is set to a non-zero value
bool debug_enabled();

// Writes "[HH:MM:SS] [TAG] " and returns the stream; callers finish the line with std::endl.
std::ostream& log_out(const char* tag);
std::ostream& log_err(const char* tag);

// Like log_out but writes to a null stream unless debug output is enabled.
std::ostream& log_debug(const char* tag);

// 1048576 -> "1.0 MB"
std::string format_mb(std::uint64_t bytes);

} // namespace linkshare
