// Integration tests for the innovation statistics harvester

#include "../testing.h"

#include <common/errors.h>
#include <common/time.h>
#include <harvest/harvest.h>

using Catch::Matchers::WithinAbs;

// Records of a harvest that is expected to return records
auto harvestRecords(const YAML::Node& config)
  -> std::vector<scorehv::HarvestedData>
{
    auto result { scorehv::harvest(config) };
    REQUIRE(std::holds_alternative<std::vector<scorehv::HarvestedData>>(result));
    return std::get<std::vector<scorehv::HarvestedData>>(result);
}

TEST_CASE("integration tests")
{
    writeInnovFiles();
    const auto regions { scorehv::defaultRegions() };
    const std::string config_filename { data_dir + "/harvest_config.yaml" };

    SECTION("Temperature bias, default regions")
    {
        const auto records { harvestRecords(
          innovConfig("innov_stats_netcdf")) };
        REQUIRE(records.size() == regions.size() * plevs.size());
        for (const auto& record : records) {
            CHECK(record.metric == "temperature");
            CHECK(record.stat == "bias");
            CHECK(record.filename == "innov_stats_temperature_bias");
            CHECK(record.elevation_unit == "plevs");
            CHECK(scorehv::timeToString(record.cycletime)
                  == "2015-12-02 06:00:00");
        }
        // Region major, then elevation level
        for (int i_region {}; i_region < static_cast<int>(regions.size());
             ++i_region) {
            for (int i_level {}; i_level < static_cast<int>(plevs.size());
                 ++i_level) {
                const auto& record {
                    records[i_region * plevs.size() + i_level]
                };
                CHECK(record.region_name == regions[i_region].name());
                CHECK(record.region_bounds == regions[i_region].grid());
                CHECK(record.region_min_lat == regions[i_region].minLat());
                CHECK(record.region_max_lat == regions[i_region].maxLat());
                CHECK(record.elevation == plevs[i_level]);
                CHECK_THAT(record.value,
                           WithinAbs(fixtureValue(0, i_region, i_level),
                                     1e-12));
            }
        }
    }

    SECTION("First generation, all metrics and stats")
    {
        auto config { innovConfig("innov_temperature_netcdf") };
        config["stats"] = YAML::Load("[bias, count, rmsd]");
        config["metrics"] = YAML::Load("[temperature, spechumid, uvwind]");
        config["regions"]["tropics"]["lat_min"] = -20.0;
        config["regions"]["tropics"]["lat_max"] = 20.0;
        config["regions"]["global"]["lat_min"] = -90.0;
        config["regions"]["global"]["lat_max"] = 90.0;
        const auto records { harvestRecords(config) };
        REQUIRE(records.size() == 3 * 2 * 3 * plevs.size());
        for (const auto& record : records) {
            CHECK_FALSE(record.filename.has_value());
            CHECK(record.elevation_unit == "mb");
        }
        // Metric major, then region, stat, and level
        CHECK(records.front().metric == "temperature");
        CHECK(records.back().metric == "uvwind");
        const auto& record { records[plevs.size() * 4 + 1] };
        CHECK(record.metric == "temperature");
        CHECK(record.region_name == "global");
        CHECK(record.stat == "count");
        CHECK(record.elevation == plevs[1]);
        CHECK_THAT(record.value, WithinAbs(fixtureValue(1, 1, 1), 1e-12));
    }

    SECTION("Configuration from node and file")
    {
        auto config { innovConfig("innov_stats_netcdf") };
        config["stats"] = YAML::Load("[bias, rmsd]");
        config["metrics"] = YAML::Load("[temperature, uvwind]");
        writeConfig(config, config_filename);
        const auto records_node { harvestRecords(config) };
        const auto result_file { scorehv::harvestFile(config_filename) };
        REQUIRE(std::holds_alternative<std::vector<scorehv::HarvestedData>>(
          result_file));
        const auto& records_file {
            std::get<std::vector<scorehv::HarvestedData>>(result_file)
        };
        CHECK(records_node.size() == 2 * regions.size() * 2 * plevs.size());
        CHECK(records_node == records_file);
    }

    SECTION("Repeated harvests")
    {
        const auto config { innovConfig("innov_stats_netcdf") };
        CHECK(harvestRecords(config) == harvestRecords(config));
    }

    SECTION("Table output")
    {
        auto config { innovConfig("innov_stats_netcdf") };
        config["output_format"] = "pandas_dataframe";
        config["stats"] = YAML::Load("[bias, count]");
        const auto result { scorehv::harvest(config) };
        REQUIRE(std::holds_alternative<scorehv::HarvestedTable>(result));
        const auto& table { std::get<scorehv::HarvestedTable>(result) };
        const auto n_rows { static_cast<long int>(2 * regions.size()
                                                  * plevs.size()) };
        CHECK(table.size() == n_rows);
        CHECK(scorehv::resultSize(result) == n_rows);
        CHECK(static_cast<long int>(table.region_name.size()) == n_rows);
        CHECK(table.elevation.size() == n_rows);
        CHECK(scorehv::HarvestedTable::columnNames().size() == 9);
        CHECK(table.filename.front() == "innov_stats_temperature_bias");
        CHECK(table.filename.back() == "innov_stats_temperature_count");
        CHECK(table.stat[plevs.size()] == "count");
        CHECK_THAT(table.value(0), WithinAbs(fixtureValue(0, 0, 0), 1e-12));
        CHECK_THAT(table.elevation.sum(),
                   WithinAbs(2 * regions.size() * 1750.0, 1e-9));
    }

    SECTION("Custom elevation coordinate")
    {
        writeInnovFile(innovFilename("spechumid"), "depth");
        auto config { innovConfig("innov_stats_netcdf") };
        config["metrics"] = YAML::Load("[spechumid]");
        config["elevation_unit"] = "depth";
        const auto records { harvestRecords(config) };
        REQUIRE(records.size() == regions.size() * plevs.size());
        CHECK(records.front().elevation_unit == "depth");
        CHECK(records.front().filename == "innov_stats_spechumid_bias");
        CHECK(records.front().elevation == plevs.front());
        // The default coordinate is missing from that file
        config.remove("elevation_unit");
        CHECK_THROWS_AS(scorehv::harvest(config), scorehv::ExtractionError);
    }

    SECTION("Cycletime naming scheme")
    {
        auto config { innovConfig("innov_stats_netcdf") };
        config["file_meta"] = YAML::Node {};
        config["file_meta"]["cycletime"] =
          scorehv::parseTime("2015120200", "%Y%m%d%H");
        config["file_meta"]["filepath_format_str"] = data_dir;
        config["file_meta"]["filename_format_str"] =
          "innov_stats.metric.%Y%m%d%H.nc";
        const auto records { harvestRecords(config) };
        REQUIRE(records.size() == regions.size() * plevs.size());
        CHECK(scorehv::timeToString(records.front().cycletime)
              == "2015-12-02 06:00:00");
    }

    SECTION("Region missing from the file")
    {
        auto config { innovConfig("innov_stats_netcdf") };
        config["regions"]["arctic"]["lat_min"] = 66.5;
        config["regions"]["arctic"]["lat_max"] = 90.0;
        CHECK_THROWS_AS(scorehv::harvest(config), scorehv::ExtractionError);
    }

    SECTION("Statistic and elevation lengths differ")
    {
        const std::string filename { innovFilename("uvwind") };
        {
            netCDF::NcFile nc { filename, netCDF::NcFile::replace };
            const auto nc_levels { nc.addDim("nlevs", plevs.size()) };
            const auto nc_short { nc.addDim("nlevs_short", 2) };
            nc.addVar("plevs", netCDF::ncDouble, nc_levels)
              .putVar(plevs.data());
            const std::vector<double> values { 1.0, 2.0 };
            nc.addVar("bias_tropics", netCDF::ncDouble, nc_short)
              .putVar(values.data());
        }
        auto config { innovConfig("innov_stats_netcdf") };
        config["metrics"] = YAML::Load("[uvwind]");
        config["regions"]["tropics"]["lat_min"] = -20.0;
        config["regions"]["tropics"]["lat_max"] = 20.0;
        CHECK_THROWS_AS(scorehv::harvest(config), scorehv::ExtractionError);
    }

    SECTION("Not a NetCDF file")
    {
        std::ofstream { innovFilename("temperature") } << "not netcdf\n";
        CHECK_THROWS_AS(scorehv::harvest(innovConfig("innov_stats_netcdf")),
                        scorehv::ExtractionError);
    }
}
