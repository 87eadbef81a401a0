#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>  // stringify
#include <string>

namespace streamkit {
namespace utility {

// Wall-clock time of a log record
struct Timestamp {
    std::chrono::time_point<std::chrono::system_clock> timestamp;

    Timestamp(): timestamp(std::chrono::system_clock::now()) {}
};

inline std::string stringifyTimestamp(Timestamp ts)
{
    const auto ts_seconds {std::chrono::floor<std::chrono::seconds>(ts.timestamp)};
    const std::time_t system_time = std::chrono::system_clock::to_time_t(ts_seconds);

    std::tm local_time {};
    localtime_r(&system_time, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%F %T%z");
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const Timestamp& ts)
{
    os << stringifyTimestamp(ts);
    return os;
}

}  // namespace utility
}  // namespace streamkit
