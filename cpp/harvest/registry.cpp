// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "registry.h"

#include <common/errors.h>

namespace scorehv {

// Registry entry for a configuration class and the harvester reading it
template <typename Config, typename DataParser>
static auto makeEntry(const std::string& name) -> Harvester
{
    return { name,
             [](const YAML::Node& config) -> std::unique_ptr<Settings> {
                 auto settings { std::make_unique<Config>(config) };
                 settings->init();
                 return settings;
             },
             [](const Settings& settings) -> std::unique_ptr<BaseHarvester> {
                 const auto* config { dynamic_cast<const Config*>(&settings) };
                 if (config == nullptr) {
                     throw RegistryError {
                         "configuration does not belong to this harvester"
                     };
                 }
                 return std::make_unique<DataParser>(*config);
             } };
}

auto harvesterRegistry() -> const std::map<std::string, Harvester>&
{
    static const std::map<std::string, Harvester> registry {
        { "innov_temperature_netcdf",
          makeEntry<SettingsInnovTemperature, InnovTemperatureHarvester>(
            "innovation statistics temperature (netcdf)") },
        { "innov_stats_netcdf",
          makeEntry<SettingsInnovStats, InnovStatsHarvester>(
            "innovation statistics (netcdf)") },
    };
    return registry;
}

auto findHarvester(const std::string& harvester_name) -> const Harvester&
{
    const auto& registry { harvesterRegistry() };
    const auto it { registry.find(harvester_name) };
    if (it == registry.end()) {
        std::string valid_names {};
        for (const auto& [key, harvester] : registry) {
            valid_names += (valid_names.empty() ? "" : ", ") + key;
        }
        throw RegistryError { "unknown harvester " + harvester_name
                              + ", must be one of " + valid_names };
    }
    return it->second;
}

} // namespace scorehv
