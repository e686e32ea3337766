// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace scorehv {

auto Settings::init() -> void
{
    default_config = YAML::Load(dumpConfig(false));
    scanKeys();
    unrecognizedKeywordCheck();
    checkParameters();
}

auto Settings::moveToMap(Emitter& emitter,
                         const std::vector<std::string>& yaml_keys) -> void
{
    const std::vector<std::string> parents { yaml_keys.cbegin(),
                                             yaml_keys.cend() - 1 };
    while (cur_map_loc.size() > parents.size()
           || !std::equal(
             cur_map_loc.cbegin(), cur_map_loc.cend(), parents.cbegin())) {
        emitter << YAML::EndMap;
        cur_map_loc.pop_back();
    }
    while (cur_map_loc.size() < parents.size()) {
        cur_map_loc.push_back(parents.at(cur_map_loc.size()));
        emitter << YAML::Key << cur_map_loc.back() << YAML::Value
                << YAML::BeginMap;
    }
}

// Paths of all leaves of a YAML tree. Sequences and scalars are leaves.
// NOLINTNEXTLINE(misc-no-recursion)
static auto collectLeafKeys(const YAML::Node& node,
                            std::vector<std::string>& path,
                            std::vector<std::vector<std::string>>& leaves)
  -> void
{
    if (!node.IsMap()) {
        if (!path.empty()) {
            leaves.push_back(path);
        }
        return;
    }
    for (const auto& child : node) {
        path.push_back(child.first.as<std::string>());
        collectLeafKeys(child.second, path, leaves);
        path.pop_back();
    }
}

auto Settings::unrecognizedKeywordCheck() const -> void
{
    std::vector<std::vector<std::string>> leaves {};
    std::vector<std::string> path {};
    collectLeafKeys(config, path, leaves);
    // Children of a map-valued parameter such as regions are known too
    const auto is_known { [this](const std::vector<std::string>& leaf) {
        return std::ranges::any_of(all_valid_keys, [&leaf](const auto& keys) {
            return keys.size() <= leaf.size()
                   && std::equal(keys.cbegin(), keys.cend(), leaf.cbegin());
        });
    } };
    for (const auto& leaf : leaves) {
        if (!is_known(leaf)) {
            spdlog::warn("unrecognized input parameter: {}",
                         SettingBase { leaf, "", "" }.keyToStr());
        }
    }
}

auto Settings::dumpConfig(const bool verbose) -> std::string
{
    Emitter emitter {};
    emitter.SetBoolFormat(YAML::YesNoBool);
    emitter.SetNullFormat(YAML::LowerNull);
    emitter.verbose = verbose;
    cur_map_loc.clear();
    emitter << YAML::BeginMap;
    dump_emitter = &emitter;
    scanKeys();
    dump_emitter = nullptr;
    for (; !cur_map_loc.empty(); cur_map_loc.pop_back()) {
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndMap;
    return emitter.c_str();
}

// Defaults overridden by whatever the input sets. Maps are merged
// recursively, any other input node replaces the default.
// NOLINTNEXTLINE(misc-no-recursion)
static auto mergeWithDefaults(const YAML::Node& defaults,
                              const YAML::Node& input) -> YAML::Node
{
    if (!defaults.IsMap() || !input.IsMap()) {
        return input;
    }
    YAML::Node merged { YAML::NodeType::Map };
    for (const auto& entry : defaults) {
        const auto& key { entry.first };
        if (key.IsScalar() && input[key.Scalar()]) {
            merged[key] = mergeWithDefaults(entry.second, input[key.Scalar()]);
        } else {
            merged[key] = entry.second;
        }
    }
    return merged;
}

auto Settings::getConfig() const -> std::string
{
    YAML::Emitter out {};
    out.SetBoolFormat(YAML::YesNoBool);
    out.SetNullFormat(YAML::LowerNull);
    out << mergeWithDefaults(default_config, YAML::Clone(config));
    return out.c_str();
}

} // namespace scorehv
