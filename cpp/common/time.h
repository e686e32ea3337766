// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Time and date related functions. All time points are UTC.

#pragma once

#include <chrono>
#include <string>

namespace scorehv {

using TimePoint = std::chrono::system_clock::time_point;

auto getDate() -> std::string;

// Parse a string according to a strptime format. The whole string
// must match the format, otherwise std::invalid_argument is thrown.
auto parseTime(const std::string& str, const std::string& format) -> TimePoint;

// Render a time point through a strftime format, e.g. a file name
// template such as innov_stats.temperature.%Y%m%d%H.nc
auto formatTime(const TimePoint time, const std::string& format)
  -> std::string;

// Format YYYY-mm-dd HH:MM:SS
auto timeToString(const TimePoint time) -> std::string;

} // namespace scorehv
