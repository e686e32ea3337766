// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "yaml.h"

#include "errors.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <regex>
#include <spdlog/spdlog.h>

// Mapping between an output format name and its corresponding entry
// in OutputFormat
const std::map<std::string, scorehv::OutputFormat> output_format_to_enum {
    { "tuples_list", scorehv::OutputFormat::records },
    { "pandas_dataframe", scorehv::OutputFormat::table },
};

// Accepted layouts of a timestamp scalar
constexpr std::array timestamp_formats { "%Y-%m-%d %H:%M:%S",
                                         "%Y-%m-%dT%H:%M:%S",
                                         "%Y-%m-%dT%H:%M:%SZ",
                                         "%Y-%m-%d %H:%M",
                                         "%Y-%m-%d" };

namespace YAML {

auto convert<scorehv::OutputFormat>::decode(const Node& node,
                                            scorehv::OutputFormat& rhs) -> bool
{
    try {
        rhs = output_format_to_enum.at(node.as<std::string>());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument { "unknown output format: "
                                      + node.as<std::string>() };
    }
    return true;
}

auto convert<scorehv::TimePoint>::encode(const scorehv::TimePoint& rhs) -> Node
{
    return Node { scorehv::timeToString(rhs) };
}

auto convert<scorehv::TimePoint>::decode(const Node& node,
                                         scorehv::TimePoint& rhs) -> bool
{
    if (!node.IsScalar()) {
        return false;
    }
    for (const std::string format : timestamp_formats) {
        try {
            rhs = scorehv::parseTime(node.Scalar(), format);
            return true;
        } catch (const std::invalid_argument&) {
            // Try the next layout
        }
    }
    return false;
}

} // namespace YAML

namespace scorehv {

auto operator<<(YAML::Emitter& out,
                const OutputFormat output_format) -> YAML::Emitter&
{
    const auto it { std::ranges::find_if(
      output_format_to_enum,
      [output_format](const auto& item) {
          return item.second == output_format;
      }) };
    out << it->first;
    return out;
}

auto operator<<(YAML::Emitter& out, const TimePoint time) -> YAML::Emitter&
{
    out << timeToString(time);
    return out;
}

// Replace ${VAR} references in a string by environment variable values
static auto expandEnvVars(const std::string& str) -> std::string
{
    static const std::regex env_var { R"(\$\{([^}{]+)\})" };
    std::string result {};
    size_t last {};
    for (auto it { std::sregex_iterator(str.begin(), str.end(), env_var) };
         it != std::sregex_iterator {};
         ++it) {
        const auto& match { *it };
        const auto pos { static_cast<size_t>(match.position()) };
        result += str.substr(last, pos - last);
        if (const char* value { std::getenv(match[1].str().c_str()) };
            value != nullptr) {
            result += value;
        } else {
            result += match.str();
        }
        last = pos + match.length();
    }
    result += str.substr(last);
    return result;
}

// NOLINTNEXTLINE(misc-no-recursion)
auto substituteEnvVars(YAML::Node node) -> void
{
    if (node.IsScalar()) {
        const std::string& scalar { node.Scalar() };
        if (scalar.find("${") != std::string::npos) {
            node = expandEnvVars(scalar);
        }
    } else if (node.IsMap()) {
        for (auto it { node.begin() }; it != node.end(); ++it) {
            substituteEnvVars(it->second);
        }
    } else if (node.IsSequence()) {
        for (auto child : node) {
            substituteEnvVars(child);
        }
    }
}

auto loadYamlFile(const std::string& yaml_file) -> YAML::Node
{
    const std::string ext { std::filesystem::path { yaml_file }
                              .extension()
                              .string() };
    if (ext != ".yml" && ext != ".yaml") {
        throw ConfigError { "Not a recognized yaml extension: " + ext };
    }
    std::vector<YAML::Node> documents {};
    try {
        documents = YAML::LoadAllFromFile(yaml_file);
    } catch (const YAML::Exception& e) {
        throw ConfigError { "Cannot load yaml file: " + yaml_file + ", "
                            + e.what() };
    }
    if (documents.size() > 1) {
        throw ConfigError { "Too many documents in " + yaml_file
                            + ": loaded document count: "
                            + std::to_string(documents.size()) };
    }
    if (documents.empty()) {
        throw ConfigError { "No documents loaded from " + yaml_file };
    }
    spdlog::debug("Loaded configuration file {}", yaml_file);
    substituteEnvVars(documents.front());
    return documents.front();
}

} // namespace scorehv
