// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "innov_netcdf.h"

#include <common/errors.h>
#include <netcdf>
#include <spdlog/spdlog.h>

namespace scorehv {

// Read a 1-D variable into an array
static auto readVariable(const netCDF::NcFile& nc,
                         const std::string& name) -> Eigen::ArrayXd
{
    const netCDF::NcVar var { nc.getVar(name) };
    if (var.isNull()) {
        throw ExtractionError { "variable " + name + " not found" };
    }
    if (var.getDimCount() != 1) {
        throw ExtractionError { "variable " + name + " must be 1-D, found "
                                + std::to_string(var.getDimCount())
                                + " dimensions" };
    }
    Eigen::ArrayXd data(var.getDim(0).getSize());
    var.getVar(data.data());
    return data;
}

auto readInnovStats(const SettingsInnovTemperature& settings,
                    const std::string& elevation_var,
                    const std::string& elevation_unit,
                    const bool named) -> std::vector<HarvestedData>
{
    std::vector<HarvestedData> harvested_data {};
    for (const auto& metric : settings.getMetricsMeta()) {
        spdlog::info("Reading {}", metric.filename());
        try {
            const netCDF::NcFile nc { metric.filename(),
                                      netCDF::NcFile::read };
            const Eigen::ArrayXd elevation { readVariable(nc, elevation_var) };
            for (const auto& region : settings.getRegions()) {
                for (const auto& stat : settings.getStats()) {
                    const std::string var_name { stat + '_' + region.name() };
                    const Eigen::ArrayXd values { readVariable(nc, var_name) };
                    if (values.size() != elevation.size()) {
                        throw ExtractionError {
                            "length of " + var_name + " ("
                            + std::to_string(values.size())
                            + ") differs from the length of " + elevation_var
                            + " (" + std::to_string(elevation.size()) + ")"
                        };
                    }
                    HarvestedData record {};
                    if (named) {
                        record.filename = std::string { innov::record_prefix }
                                          + metric.name() + '_' + stat;
                    }
                    record.cycletime = metric.cycletime();
                    record.region_name = region.name();
                    record.region_min_lat = region.minLat();
                    record.region_max_lat = region.maxLat();
                    record.region_bounds = region.grid();
                    record.elevation_unit = elevation_unit;
                    record.metric = metric.name();
                    record.stat = stat;
                    for (long int i {}; i < values.size(); ++i) {
                        record.elevation = elevation(i);
                        record.value = values(i);
                        harvested_data.push_back(record);
                    }
                    spdlog::debug("{}: {} levels", var_name, values.size());
                }
            }
        } catch (const std::exception&) {
            rethrowWithContext<ExtractionError>("problem parsing netcdf file "
                                                + metric.filename());
        }
    }
    spdlog::info("Harvested {} records", harvested_data.size());
    return harvested_data;
}

auto InnovTemperatureHarvester::getData() const -> HarvestResult
{
    return readInnovStats(settings,
                          std::string { innov::plev_variable },
                          std::string { innov::plev_pressure_unit },
                          false);
}

auto InnovStatsHarvester::getData() const -> HarvestResult
{
    auto records { readInnovStats(settings,
                                  settings.getElevationUnit(),
                                  settings.getElevationUnit(),
                                  true) };
    if (settings.getOutputFormat() == OutputFormat::table) {
        return toTable(records);
    }
    return records;
}

} // namespace scorehv
