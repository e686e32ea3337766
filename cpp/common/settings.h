// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Base class of a harvester configuration. A derived class declares
// one Setting member per parameter and lists them in scanKeys:
//
// class SettingsExample : public Settings
// {
// public:
//     Setting<std::vector<std::string>> stats {
//         { "stats" }, {}, "innovation statistics to harvest"
//     };
//     explicit SettingsExample(const YAML::Node& config)
//       : Settings { config }
//     {}
//     auto scanKeys() -> void override { scan(stats); }
//     auto checkParameters() -> void override {}
// };
//
// The same scanKeys drives both reading the configuration (init) and
// writing it out (dumpConfig), so the parameter list is written only
// once.

#pragma once

#include "errors.h"
#include "yaml.h"

namespace scorehv {

class Settings
{
private:
    // Set while dumping. scan then writes into it instead of reading.
    Emitter* dump_emitter { nullptr };
    // Keys of the maps the emitter is currently inside of
    std::vector<std::string> cur_map_loc {};
    // Close and open maps so that the emitter is inside the map
    // holding a parameter with these keys
    auto moveToMap(Emitter& emitter,
                   const std::vector<std::string>& yaml_keys) -> void;
    auto unrecognizedKeywordCheck() const -> void;

protected:
    // Configuration as given by the caller
    YAML::Node config {};
    // Configuration containing only the default values
    YAML::Node default_config {};
    // Keys of all parameters seen by scan
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Validate values and their consistency. Throws ConfigError or a
    // more specific error on the first problem.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    // The node is cloned. The caller's node is never modified.
    explicit Settings(const YAML::Node& config)
      : config { YAML::Clone(config) }
    {}
    Settings(const Settings&) = delete;
    auto operator=(const Settings&) -> Settings& = delete;
    // Scan all parameters, warn about unknown keys, check parameters
    auto init() -> void;
    virtual auto scanKeys() -> void = 0;
    // Read one parameter from the configuration, or write it out when
    // dumping. A parameter absent from the configuration keeps its
    // default.
    template <typename T>
    auto scan(Setting<T>& item) -> void
    {
        if (dump_emitter != nullptr) {
            moveToMap(*dump_emitter, item.yaml_keys);
            *dump_emitter << item;
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        YAML::Node node { YAML::Clone(config) };
        for (const auto& key : item.yaml_keys) {
            if (!node.IsMap() || !node[key]) {
                return;
            }
            node = node[key];
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            throw ConfigError { "cannot set " + item.keyToStr() + ", which is "
                                + "of type " + item.type + ", to the value "
                                + (node.IsScalar() ? node.Scalar() : "") };
        } catch (const std::invalid_argument& e) {
            throw ConfigError { "cannot set " + item.keyToStr() + ": "
                                + e.what() };
        }
    }
    // Configuration as YAML text. Before init this is the default
    // configuration. The verbose form also lists type and description
    // of each parameter.
    auto dumpConfig(const bool verbose = true) -> std::string;
    // Configuration given by the caller with defaults filled in
    [[nodiscard]] auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace scorehv
