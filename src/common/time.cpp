#include "drivescore/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace drivescore::time {

std::string to_iso8601(Timestamp t)
{
    const auto seconds = std::chrono::floor<std::chrono::seconds>(t);
    const auto millis  = std::chrono::duration_cast<std::chrono::milliseconds>(t - seconds).count();

    const std::time_t raw = Clock::to_time_t(seconds);
    std::tm           utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace drivescore::time
