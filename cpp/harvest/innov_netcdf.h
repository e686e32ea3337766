// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Harvesters of innovation statistics stored in NetCDF files. Each
// file holds the statistics of one metric. For every region and
// statistic there is a 1-D variable {stat}_{region} with one value
// per elevation level, e.g. bias_tropics. The elevation levels are
// stored in a coordinate variable (plevs by default).

#pragma once

#include "harvested_data.h"
#include "settings_innov.h"

namespace scorehv {

// Each harvester reads the data described by its configuration. The
// configuration must outlive the harvester.
class BaseHarvester
{
public:
    BaseHarvester() = default;
    BaseHarvester(const BaseHarvester&) = delete;
    auto operator=(const BaseHarvester&) -> BaseHarvester& = delete;
    // Read all files of the configuration. Throws ExtractionError if a
    // file cannot be read, a variable is missing, or the length of a
    // statistic differs from the number of elevation levels.
    [[nodiscard]] virtual auto getData() const -> HarvestResult = 0;
    virtual ~BaseHarvester() = default;
};

// First generation: elevation from plevs with unit mb, records are
// not named.
class InnovTemperatureHarvester : public BaseHarvester
{
private:
    const SettingsInnovTemperature& settings;

public:
    explicit InnovTemperatureHarvester(const SettingsInnovTemperature& settings)
      : settings { settings }
    {}
    [[nodiscard]] auto getData() const -> HarvestResult override;
};

// Second generation: configurable elevation coordinate, named records,
// optionally returned as a table.
class InnovStatsHarvester : public BaseHarvester
{
private:
    const SettingsInnovStats& settings;

public:
    explicit InnovStatsHarvester(const SettingsInnovStats& settings)
      : settings { settings }
    {}
    [[nodiscard]] auto getData() const -> HarvestResult override;
};

// Walk metric x region x stat and emit one record per elevation
// level. Elevation values are read from the variable elevation_var
// and labeled with elevation_unit. If named, each record gets the
// name innov_stats_<metric>_<stat>.
auto readInnovStats(const SettingsInnovTemperature& settings,
                    const std::string& elevation_var,
                    const std::string& elevation_unit,
                    const bool named) -> std::vector<HarvestedData>;

} // namespace scorehv
