#pragma once

#include <common/region.h>
#include <common/yaml.h>

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include <netcdf>
#include <string>
#include <unistd.h>
#include <vector>

// Much of the interface is file-based
const std::string tmp_dir { std::filesystem::temp_directory_path().string() };
// One directory per process so that tests may run in parallel
const std::string data_dir { tmp_dir + "/scorehv_innov_"
                             + std::to_string(::getpid()) };
const std::string cycle { "2015120206" };
const std::vector<double> plevs { 1000.0, 500.0, 250.0 };
const std::array<std::string, 3> all_metrics { "temperature",
                                               "spechumid",
                                               "uvwind" };
const std::array<std::string, 3> all_stats { "bias", "count", "rmsd" };

// Name of the fixture file of a metric at the test cycle
auto innovFilename(const std::string& metric) -> std::string
{
    return data_dir + "/innov_stats." + metric + '.' + cycle + ".nc";
}

// Value stored at a given level of {stat}_{region}. Different for
// every stat, region, and level.
auto fixtureValue(const int i_stat,
                  const int i_region,
                  const int i_level) -> double
{
    return 100.0 * i_stat + 10.0 * i_region + i_level + 0.5;
}

// Write an innovation statistics file with a variable for every
// statistic and default region. The elevation coordinate is stored
// under elevation_var.
auto writeInnovFile(const std::string& filename,
                    const std::string& elevation_var = "plevs") -> void
{
    std::filesystem::create_directories(
      std::filesystem::path { filename }.parent_path());
    netCDF::NcFile nc { filename, netCDF::NcFile::replace };
    const auto nc_levels { nc.addDim("nlevs", plevs.size()) };
    nc.addVar(elevation_var, netCDF::ncDouble, nc_levels).putVar(plevs.data());
    const auto regions { scorehv::defaultRegions() };
    for (int i_stat {}; i_stat < static_cast<int>(all_stats.size()); ++i_stat) {
        for (int i_region {}; i_region < static_cast<int>(regions.size());
             ++i_region) {
            std::vector<double> values(plevs.size());
            for (int i_level {}; i_level < static_cast<int>(plevs.size());
                 ++i_level) {
                values[i_level] = fixtureValue(i_stat, i_region, i_level);
            }
            nc.addVar(all_stats[i_stat] + '_' + regions[i_region].name(),
                      netCDF::ncDouble,
                      nc_levels)
              .putVar(values.data());
        }
    }
}

// Fixture files of all metrics
auto writeInnovFiles(const std::string& elevation_var = "plevs") -> void
{
    for (const auto& metric : all_metrics) {
        writeInnovFile(innovFilename(metric), elevation_var);
    }
}

// Configuration using the cycle string naming scheme
auto innovConfig(const std::string& harvester_name) -> YAML::Node
{
    YAML::Node config {};
    config["harvester_name"] = harvester_name;
    config["file_meta"]["filepath"] = data_dir;
    config["file_meta"]["cycle"] = cycle;
    config["file_meta"]["cycletime_str"] = "%Y%m%d%H";
    config["file_meta"]["filename_str"] = "innov_stats.metric.%Y%m%d%H.nc";
    config["stats"].push_back("bias");
    config["metrics"].push_back("temperature");
    return config;
}

// Write a configuration to a YAML file
auto writeConfig(const YAML::Node& config, const std::string& filename) -> void
{
    YAML::Emitter out {};
    out << config;
    std::ofstream file { filename };
    file << out.c_str() << '\n';
}
