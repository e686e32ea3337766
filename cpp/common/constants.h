// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <array>
#include <chrono>
#include <string_view>

namespace scorehv {

// Geographic limits
namespace geo {

constexpr double min_lat { -90.0 };
constexpr double max_lat { 90.0 };
constexpr int min_lon { -180 };
constexpr int max_lon { 180 };
// Number of vertices of a closed rectangular region boundary
constexpr int n_vertices { 5 };

} // namespace geo

// Innovation statistics files
namespace innov {

constexpr std::array<std::string_view, 3> valid_metrics { "temperature",
                                                          "spechumid",
                                                          "uvwind" };
constexpr std::array<std::string_view, 3> valid_stats { "bias",
                                                        "count",
                                                        "rmsd" };

// Earliest cycle time accepted (the latest is the current time)
constexpr int min_cycle_year { 1988 };

// Observations in a file named after cycle time t are valid at t + 6 h
constexpr std::chrono::hours obs_offset { 6 };

// Elevation coordinate of the first generation files and its units
constexpr std::string_view plev_variable { "plevs" };
constexpr std::string_view plev_pressure_unit { "mb" };

// Placeholder in file name templates that is replaced by the metric name
constexpr std::string_view metric_placeholder { "metric" };

// Prefix of record names produced by the second generation harvester
constexpr std::string_view record_prefix { "innov_stats_" };

} // namespace innov

// Output shape of a harvest. The configuration strings are
// "tuples_list" and "pandas_dataframe".
enum class OutputFormat
{
    records,
    table,
};

} // namespace scorehv
