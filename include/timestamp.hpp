#pragma once

#include <chrono>
#include <string>

namespace probe {

// Formats a time point as ISO-8601 UTC with microseconds and no zone suffix,
// e.g. "2024-01-01T00:00:00.000000".
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Current wall-clock time in the format above.
std::string utc_timestamp();

} // namespace probe
