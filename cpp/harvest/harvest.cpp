// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "harvest.h"

#include "registry.h"

#include <common/errors.h>
#include <common/yaml.h>
#include <spdlog/spdlog.h>

namespace scorehv {

auto harvest(const YAML::Node& config) -> HarvestResult
{
    if (!config.IsMap() || !config["harvester_name"]) {
        throw RegistryError { "harvester_name missing from configuration" };
    }
    const YAML::Node name_node { config["harvester_name"] };
    if (!name_node.IsScalar()) {
        throw RegistryError { "harvester_name must be a string" };
    }
    const Harvester& harvester { findHarvester(name_node.Scalar()) };
    spdlog::info("Harvester: {}", harvester.name);
    const auto settings { harvester.config_handler(config) };
    spdlog::debug("Configuration:\n{}", settings->getConfig());
    const auto data_parser { harvester.data_parser(*settings) };
    return data_parser->getData();
}

auto harvestFile(const std::string& config_file) -> HarvestResult
{
    return harvest(loadYamlFile(config_file));
}

} // namespace scorehv
