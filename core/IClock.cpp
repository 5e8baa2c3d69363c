#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace iotpipe {

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return std::string();
    }

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

} // namespace iotpipe
