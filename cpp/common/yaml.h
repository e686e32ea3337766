// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// yaml-cpp support for the configuration types of the harvesters
// (optionals, output formats, timestamps, Setting) and loading of
// configuration files.

#pragma once

#include "constants.h"
#include "setting.h"
#include "time.h"

#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

// A null node leaves the optional empty
template <typename T>
struct convert<std::optional<T>>
{
    static auto decode(const Node& node, std::optional<T>& rhs) -> bool
    {
        if (node.IsNull()) {
            rhs.reset();
        } else {
            rhs = node.as<T>();
        }
        return true;
    }
};

// tuples_list or pandas_dataframe. Any other name throws
// std::invalid_argument.
template <>
struct convert<scorehv::OutputFormat>
{
    static auto decode(const Node& node, scorehv::OutputFormat& rhs) -> bool;
};

// Accepts 2015-12-02 00:00:00, 2015-12-02T00:00:00,
// 2015-12-02T00:00:00Z, 2015-12-02 00:00 and 2015-12-02 (UTC)
template <>
struct convert<scorehv::TimePoint>
{
    static auto encode(const scorehv::TimePoint& rhs) -> Node;
    static auto decode(const Node& node, scorehv::TimePoint& rhs) -> bool;
};

} // namespace YAML

namespace scorehv {

auto operator<<(YAML::Emitter& out,
                const OutputFormat output_format) -> YAML::Emitter&;

auto operator<<(YAML::Emitter& out, const TimePoint time) -> YAML::Emitter&;

// An empty optional is written as null
template <typename T>
auto operator<<(YAML::Emitter& out,
                const std::optional<T>& value) -> YAML::Emitter&
{
    return value.has_value() ? out << *value : out << YAML::Null;
}

// YAML::Emitter that knows whether parameters are written with their
// type and description
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

// Write a parameter as "name: value" or, if verbose, as
//
// name:
//   default: value
//   type: ...
//   info: |
//     ...
template <typename T>
static auto operator<<(Emitter& out, const Setting<T>& setting) -> Emitter&
{
    // NOLINTNEXTLINE(cppcoreguidelines-slicing)
    const T value { static_cast<const T&>(setting) };
    out << YAML::Key << setting.name() << YAML::Value;
    if (!out.verbose) {
        out << value;
        return out;
    }
    out << YAML::BeginMap;
    out << YAML::Key << "default" << YAML::Value << value;
    out << YAML::Key << "type" << YAML::Value << setting.type;
    out << YAML::Key << "info" << YAML::Value << YAML::Literal << setting.info;
    out << YAML::EndMap;
    return out;
}

// Load a configuration file with extension .yml or .yaml holding
// exactly one document. ${VAR} in scalars is replaced by the value of
// the environment variable VAR if it is set. Throws ConfigError.
auto loadYamlFile(const std::string& yaml_file) -> YAML::Node;

// Replace ${VAR} in every scalar of node
auto substituteEnvVars(YAML::Node node) -> void;

} // namespace scorehv
