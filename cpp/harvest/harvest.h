// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Entry points of the library. The configuration names the harvester
// with harvester_name, e.g.
//
//   harvester_name: innov_stats_netcdf
//   file_meta:
//     filepath: /data/innov
//     cycle: '2015120206'
//     cycletime_str: '%Y%m%d%H'
//     filename_str: innov_stats.metric.%Y%m%d%H.nc
//   stats: [bias, rmsd]
//   metrics: [temperature]
//
// No state is kept between calls.

#pragma once

#include "harvested_data.h"

#include <yaml-cpp/yaml.h>

namespace scorehv {

// Harvest using an in-memory configuration. Throws RegistryError if
// harvester_name is missing or unknown, before any file is read.
auto harvest(const YAML::Node& config) -> HarvestResult;

// Load a YAML configuration file (see loadYamlFile) and harvest
auto harvestFile(const std::string& config_file) -> HarvestResult;

} // namespace scorehv
