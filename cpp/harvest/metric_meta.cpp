// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "metric_meta.h"

#include <algorithm>
#include <common/constants.h>
#include <common/errors.h>
#include <common/io.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <sstream>

namespace scorehv {

auto FileMeta::describe() const -> std::string
{
    std::ostringstream s {};
    bool first { true };
    const auto add { [&](const std::string& key,
                         const std::optional<std::string>& value) {
        if (value) {
            s << (first ? "" : ", ") << key << ": " << *value;
            first = false;
        }
    } };
    s << '{';
    add("filepath", filepath);
    add("cycle", cycle);
    add("cycletime_str", cycletime_str);
    add("filename_str", filename_str);
    if (cycletime) {
        add("cycletime", timeToString(*cycletime));
    }
    add("filepath_format_str", filepath_format_str);
    add("filename_format_str", filename_format_str);
    s << '}';
    return s.str();
}

auto checkCycleTime(const TimePoint time) -> void
{
    const TimePoint min_time { parseTime(
      std::to_string(innov::min_cycle_year) + "-01-01", "%Y-%m-%d") };
    const TimePoint max_time { std::chrono::system_clock::now() };
    if (time < min_time || time > max_time) {
        throw TimeRangeError { "cycle time " + timeToString(time)
                               + " is out of range, must be earlier than "
                               + timeToString(max_time) + " and later than "
                               + timeToString(min_time) };
    }
}

// Return the value of a required file_meta key
static auto required(const std::optional<std::string>& value,
                     const std::string& key) -> const std::string&
{
    if (!value) {
        throw ConfigError { "file_meta is missing the key " + key };
    }
    return *value;
}

MetricMeta::MetricMeta(const std::string& name, const FileMeta& file_meta)
  : metric_name { name }, file_meta { file_meta }
{
    try {
        if (std::ranges::find(innov::valid_metrics, name)
            == innov::valid_metrics.end()) {
            throw ConfigError { "invalid metric " + name
                                + ", must be one of temperature, spechumid, "
                                  "uvwind" };
        }
        if (file_meta.cycletime) {
            naming_scheme = NamingScheme::cycletime_offset;
            locateFromCycletime();
        } else if (file_meta.cycle) {
            naming_scheme = NamingScheme::cycle_string;
            locateFromCycle();
        } else {
            throw ConfigError {
                "file_meta must contain either cycle or cycletime"
            };
        }
        checkReadableFile(file_name);
    } catch (const std::exception&) {
        rethrowWithContext<ConfigError>(
          "netcdf file could not be located for metric " + name
          + ", file_meta: " + file_meta.describe());
    }
    spdlog::debug("Metric {} file: {}", metric_name, file_name);
}

auto MetricMeta::locateFromCycle() -> void
{
    const std::string& filepath { required(file_meta.filepath, "filepath") };
    const std::string& cycletime_str { required(file_meta.cycletime_str,
                                                "cycletime_str") };
    const std::string& filename_str { required(file_meta.filename_str,
                                               "filename_str") };
    const TimePoint cycle { parseTime(*file_meta.cycle, cycletime_str) };
    checkCycleTime(cycle);
    const std::string template_name { replaceAll(
      filename_str, std::string { innov::metric_placeholder }, metric_name) };
    file_name = filepath + '/' + formatTime(cycle, template_name);
    obs_time = cycle;
}

auto MetricMeta::locateFromCycletime() -> void
{
    const std::string& filepath_format_str { required(
      file_meta.filepath_format_str, "filepath_format_str") };
    const std::string& filename_format_str { required(
      file_meta.filename_format_str, "filename_format_str") };
    const TimePoint cycle { *file_meta.cycletime };
    checkCycleTime(cycle);
    obs_time = cycle + innov::obs_offset;
    const std::string template_name { replaceAll(
      filename_format_str,
      std::string { innov::metric_placeholder },
      metric_name) };
    const std::filesystem::path directory { formatTime(cycle,
                                                       filepath_format_str) };
    file_name = (directory / formatTime(obs_time, template_name)).string();
}

} // namespace scorehv
