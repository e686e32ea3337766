// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time.h"

#include <ctime>
#include <stdexcept>

namespace scorehv {

constexpr int date_size { 100 };
// Formatted times may be whole directory paths
constexpr int format_size { 4096 };

auto getDate() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date[date_size] {};
    std::strftime(
      date, date_size * sizeof(char), "%Y %B %d %a UTC%z", std::localtime(&t));
    return date;
}

auto parseTime(const std::string& str, const std::string& format) -> TimePoint
{
    std::tm tm {};
    // Day of the month is 1 unless the format sets it
    tm.tm_mday = 1;
    const char* end { ::strptime(str.c_str(), format.c_str(), &tm) };
    if (end == nullptr || *end != '\0') {
        throw std::invalid_argument { "time data '" + str
                                      + "' does not match format '" + format
                                      + "'" };
    }
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

auto formatTime(const TimePoint time, const std::string& format)
  -> std::string
{
    if (format.empty()) {
        return {};
    }
    const std::time_t t { std::chrono::system_clock::to_time_t(time) };
    std::tm tm {};
    ::gmtime_r(&t, &tm);
    char buf[format_size] {};
    if (std::strftime(buf, format_size * sizeof(char), format.c_str(), &tm)
        == 0) {
        throw std::invalid_argument { "cannot format time with '" + format
                                      + "'" };
    }
    return buf;
}

auto timeToString(const TimePoint time) -> std::string
{
    return formatTime(time, "%Y-%m-%d %H:%M:%S");
}

} // namespace scorehv
