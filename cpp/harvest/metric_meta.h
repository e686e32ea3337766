// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Location of the innovation statistics file of one metric. The file
// name is derived from a cycle time and a file naming template given
// under file_meta in the configuration. Two naming schemes are
// supported:
//
//   cycle (string)    file_meta:
//                       filepath: /data/innov
//                       cycle: '2015120206'
//                       cycletime_str: '%Y%m%d%H'
//                       filename_str: innov_stats.metric.%Y%m%d%H.nc
//
//   cycletime         file_meta:
//                       cycletime: 2015-12-02 00:00:00
//                       filepath_format_str: /data/%Y/%m
//                       filename_format_str: innov_stats.metric.%Y%m%d%H.nc
//
// In both, the literal token "metric" in the file name template is
// replaced by the metric name. In the second scheme the file name is
// rendered at cycletime + 6 h, which is also the observation time.

#pragma once

#include <common/time.h>
#include <optional>
#include <string>

namespace scorehv {

struct FileMeta
{
    std::optional<std::string> filepath {};
    std::optional<std::string> cycle {};
    std::optional<std::string> cycletime_str {};
    std::optional<std::string> filename_str {};
    std::optional<TimePoint> cycletime {};
    std::optional<std::string> filepath_format_str {};
    std::optional<std::string> filename_format_str {};
    // For error messages, e.g. {filepath: /data, cycle: 2015120206}
    [[nodiscard]] auto describe() const -> std::string;
};

enum class NamingScheme
{
    cycle_string,
    cycletime_offset,
};

class MetricMeta
{
private:
    std::string metric_name {};
    FileMeta file_meta {};
    NamingScheme naming_scheme {};
    // Time at which the observations are valid
    TimePoint obs_time {};
    std::string file_name {};

    auto locateFromCycle() -> void;
    auto locateFromCycletime() -> void;

public:
    // Resolve the file name and check that the file is readable.
    // Throws ConfigError, TimeRangeError, or PathError with the metric
    // name and file_meta in the message.
    MetricMeta(const std::string& name, const FileMeta& file_meta);
    [[nodiscard]] auto name() const -> const std::string&
    {
        return metric_name;
    }
    [[nodiscard]] auto fileMeta() const -> const FileMeta&
    {
        return file_meta;
    }
    [[nodiscard]] auto namingScheme() const -> NamingScheme
    {
        return naming_scheme;
    }
    [[nodiscard]] auto cycletime() const -> TimePoint { return obs_time; }
    [[nodiscard]] auto filename() const -> const std::string&
    {
        return file_name;
    }
};

// Throw TimeRangeError unless 1988-01-01 <= time <= now
auto checkCycleTime(const TimePoint time) -> void;

} // namespace scorehv
