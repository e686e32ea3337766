// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Configuration of the innovation statistics harvesters. Each
// harvester generation has its own class. The second generation adds
// the elevation coordinate and the output format to the first.

#pragma once

#include "metric_meta.h"

#include <common/constants.h>
#include <common/region.h>
#include <common/settings.h>

namespace scorehv {

// Configuration of the innov_temperature_netcdf harvester
class SettingsInnovTemperature : public Settings
{
private:
    std::vector<Region> region_list {};
    std::vector<MetricMeta> metrics_meta {};

    auto checkStats() -> void;
    auto checkRegions() -> void;
    auto checkMetricsMeta() -> void;

protected:
    auto checkParameters() -> void override;

public:
    SettingsInnovTemperature() = default;
    explicit SettingsInnovTemperature(const YAML::Node& config)
      : Settings { config }
    {}

    Setting<std::string> harvester_name {
        { "harvester_name" },
        "innov_temperature_netcdf",
        "Name of the harvester in the harvester registry"
    };

    struct
    {
        Setting<std::optional<std::string>> filepath {
            { "file_meta", "filepath" },
            "Directory containing the innovation statistics files. Used\n"
            "together with cycle."
        };
        Setting<std::optional<std::string>> cycle {
            { "file_meta", "cycle" },
            "Cycle time as a string, e.g. 2015120206. It is parsed with\n"
            "cycletime_str. Ignored if cycletime is given."
        };
        Setting<std::optional<std::string>> cycletime_str {
            { "file_meta", "cycletime_str" },
            "strptime format of cycle, e.g. %Y%m%d%H"
        };
        Setting<std::optional<std::string>> filename_str {
            { "file_meta", "filename_str" },
            "strftime template of the file name. The token \"metric\" is\n"
            "replaced by the metric name, e.g.\n"
            "innov_stats.metric.%Y%m%d%H.nc"
        };
        Setting<std::optional<TimePoint>> cycletime {
            { "file_meta", "cycletime" },
            "Cycle time, e.g. 2015-12-02 00:00:00. The file name is\n"
            "rendered at cycletime + 6 h, which is also the time\n"
            "reported for the observations."
        };
        Setting<std::optional<std::string>> filepath_format_str {
            { "file_meta", "filepath_format_str" },
            "strftime template of the directory, rendered at cycletime"
        };
        Setting<std::optional<std::string>> filename_format_str {
            { "file_meta", "filename_format_str" },
            "strftime template of the file name, rendered at\n"
            "cycletime + 6 h. The token \"metric\" is replaced by the\n"
            "metric name."
        };
    } file_meta;

    Setting<std::vector<std::string>> stats {
        { "stats" },
        {},
        "Statistics to harvest (bias, count, rmsd)"
    };

    Setting<std::vector<std::string>> metrics {
        { "metrics" },
        {},
        "Metrics to harvest (temperature, spechumid, uvwind). There is\n"
        "one input file per metric."
    };

    Setting<std::optional<YAML::Node>> regions {
        { "regions" },
        "Map of region names to latitude bounds, e.g.\n"
        "  tropics:\n"
        "    lat_min: -20.0\n"
        "    lat_max: 20.0\n"
        "If omitted, the regions equatorial, global, north_hemis,\n"
        "tropics, and south_hemis are used."
    };

    auto scanKeys() -> void override;

    [[nodiscard]] auto getMetricsMeta() const -> const std::vector<MetricMeta>&
    {
        return metrics_meta;
    }
    [[nodiscard]] auto getStats() const -> const std::vector<std::string>&
    {
        return stats;
    }
    [[nodiscard]] auto getRegions() const -> const std::vector<Region>&
    {
        return region_list;
    }
};

// Configuration of the innov_stats_netcdf harvester
class SettingsInnovStats : public SettingsInnovTemperature
{
protected:
    auto checkParameters() -> void override;

public:
    SettingsInnovStats() { harvester_name = "innov_stats_netcdf"; }
    explicit SettingsInnovStats(const YAML::Node& config)
      : SettingsInnovTemperature { config }
    {
        harvester_name = "innov_stats_netcdf";
    }

    Setting<std::string> elevation_unit {
        { "elevation_unit" },
        std::string { innov::plev_variable },
        "Name of the vertical coordinate variable in the input files.\n"
        "It is also the unit label of the elevation in the output."
    };

    Setting<OutputFormat> output_format {
        { "output_format" },
        OutputFormat::records,
        "Shape of the harvested data:\n"
        "  tuples_list - list of records\n"
        "  pandas_dataframe - one column per record field"
    };

    auto scanKeys() -> void override;

    [[nodiscard]] auto getElevationUnit() const -> const std::string&
    {
        return elevation_unit;
    }
    [[nodiscard]] auto getOutputFormat() const -> OutputFormat
    {
        return output_format;
    }
};

} // namespace scorehv
