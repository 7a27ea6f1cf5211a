#include "timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace probe {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = since_epoch - seconds;
    // Pre-epoch points: borrow a second so the fraction stays positive.
    if (micros.count() < 0) {
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::time_t time_t = static_cast<std::time_t>(seconds.count());
    struct tm gmt;
    gmtime_r(&time_t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setw(6) << std::setfill('0') << micros.count();
    return ss.str();
}

std::string utc_timestamp() {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace probe
