// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Map of harvester names to their configuration and data parser
// constructors. A harvest looks up harvester_name of the
// configuration here.

#pragma once

#include "innov_netcdf.h"

#include <functional>
#include <map>
#include <memory>

namespace scorehv {

struct Harvester
{
    // Human readable description
    std::string name {};
    // Construct and validate a configuration (init() already called)
    std::function<std::unique_ptr<Settings>(const YAML::Node&)>
      config_handler {};
    // Construct a harvester from a configuration returned by
    // config_handler of the same entry
    std::function<std::unique_ptr<BaseHarvester>(const Settings&)>
      data_parser {};
};

// innov_temperature_netcdf and innov_stats_netcdf
auto harvesterRegistry() -> const std::map<std::string, Harvester>&;

// Return the registry entry. Throws RegistryError for an unknown name.
auto findHarvester(const std::string& harvester_name) -> const Harvester&;

} // namespace scorehv
