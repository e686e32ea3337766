// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_innov.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace scorehv {

auto SettingsInnovTemperature::scanKeys() -> void
{
    scan(harvester_name);
    scan(file_meta.filepath);
    scan(file_meta.cycle);
    scan(file_meta.cycletime_str);
    scan(file_meta.filename_str);
    scan(file_meta.cycletime);
    scan(file_meta.filepath_format_str);
    scan(file_meta.filename_format_str);
    scan(stats);
    scan(metrics);
    scan(regions);
}

auto SettingsInnovTemperature::checkStats() -> void
{
    if (stats.empty()) {
        throw ConfigError { "'stats' key missing or empty, must be a list of "
                            "bias, count, rmsd" };
    }
    for (const auto& stat : stats) {
        if (std::ranges::find(innov::valid_stats, stat)
            == innov::valid_stats.end()) {
            throw ConfigError { "invalid stat " + stat
                                + ", must be one of bias, count, rmsd" };
        }
    }
}

// Read a latitude bound of a region entry
static auto latBound(const YAML::Node& region,
                     const std::string& region_name,
                     const std::string& key) -> double
{
    if (!region.IsMap() || !region[key]) {
        throw ConfigError { "region " + region_name + " is missing " + key };
    }
    try {
        return region[key].as<double>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError { "region " + region_name + ": " + key
                            + " must be a number" };
    }
}

auto SettingsInnovTemperature::checkRegions() -> void
{
    region_list.clear();
    if (!regions || regions->IsNull()) {
        region_list = defaultRegions();
        return;
    }
    if (!regions->IsMap()) {
        throw ConfigError { "regions must be a map of region names to "
                            "latitude bounds" };
    }
    for (YAML::const_iterator it { regions->begin() }; it != regions->end();
         ++it) {
        const auto name { it->first.as<std::string>() };
        Region region { name,
                        latBound(it->second, name, "lat_min"),
                        latBound(it->second, name, "lat_max") };
        const auto existing { std::ranges::find_if(
          region_list,
          [&name](const Region& other) { return other.name() == name; }) };
        if (existing == region_list.end()) {
            region_list.push_back(std::move(region));
        } else {
            spdlog::warn("region {} defined more than once, using the last "
                         "definition",
                         name);
            *existing = std::move(region);
        }
    }
    if (region_list.empty()) {
        throw ConfigError { "regions must not be empty" };
    }
}

auto SettingsInnovTemperature::checkMetricsMeta() -> void
{
    metrics_meta.clear();
    if (metrics.empty()) {
        throw ConfigError { "'metrics' key missing or empty, must be a list "
                            "of temperature, spechumid, uvwind" };
    }
    // All metrics share the same file naming
    FileMeta meta {};
    meta.filepath = file_meta.filepath;
    meta.cycle = file_meta.cycle;
    meta.cycletime_str = file_meta.cycletime_str;
    meta.filename_str = file_meta.filename_str;
    meta.cycletime = file_meta.cycletime;
    meta.filepath_format_str = file_meta.filepath_format_str;
    meta.filename_format_str = file_meta.filename_format_str;
    for (const auto& metric : metrics) {
        metrics_meta.emplace_back(metric, meta);
    }
}

auto SettingsInnovTemperature::checkParameters() -> void
{
    try {
        checkStats();
    } catch (const std::exception&) {
        rethrowWithContext<ConfigError>("problem parsing stats");
    }
    try {
        checkRegions();
    } catch (const std::exception&) {
        rethrowWithContext<ConfigError>("problem parsing regions");
    }
    try {
        checkMetricsMeta();
    } catch (const std::exception&) {
        rethrowWithContext<ConfigError>("problem creating metrics_meta");
    }
}

auto SettingsInnovStats::scanKeys() -> void
{
    SettingsInnovTemperature::scanKeys();
    scan(elevation_unit);
    scan(output_format);
}

auto SettingsInnovStats::checkParameters() -> void
{
    SettingsInnovTemperature::checkParameters();
    if (elevation_unit.empty()) {
        throw ConfigError { "elevation_unit must not be empty" };
    }
}

} // namespace scorehv
