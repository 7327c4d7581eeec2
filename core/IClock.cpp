#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nearme {

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (millis.count() < 0) {
        millis += std::chrono::milliseconds(1000);
        seconds -= 1;
    }

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return ss.str();
}

} // namespace nearme
