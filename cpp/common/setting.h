// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A configuration parameter of a harvester. Every parameter knows
// where it lives in the YAML configuration (yaml_keys), what it is for
// (info) and a printable name of its value type (type). The last
// yaml key is the parameter name, the others are the enclosing
// maps. For example
//
//   file_meta:
//     cycle: '2015120206'
//
// is found with yaml_keys = { "file_meta", "cycle" }.
//
// Values of class type (strings, lists, optionals) are inherited from
// so that a parameter can be used like its value, e.g. stats.size()
// or file_meta.cycle.has_value(). Other values (numbers, enums, time
// points) are held in the value member and read through a conversion
// operator.

#pragma once

#include "time.h"

#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace scorehv {

// Name of a value type as shown in the verbose configuration
template <typename T>
auto typeName() -> std::string
{
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else if constexpr (std::is_same_v<T, int>) {
        return "integer";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double (float64)";
    } else if constexpr (std::is_same_v<T, std::string> || std::is_enum_v<T>) {
        return "string";
    } else if constexpr (std::is_same_v<T, TimePoint>) {
        return "timestamp";
    } else if constexpr (std::is_same_v<T, YAML::Node>) {
        return "map";
    } else {
        static_assert(sizeof(T) == 0, "no configuration type name for T");
    }
}

// Location and description of a parameter
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    std::string info {};
    std::string type {};

    SettingBase() = default;
    SettingBase(const std::vector<std::string>& yaml_keys,
                const std::string& type,
                const std::string& info)
      : yaml_keys { yaml_keys }, info { info }, type { type }
    {}
    // Parameter name, e.g. cycle
    [[nodiscard]] auto name() const -> const std::string&
    {
        return yaml_keys.back();
    }
    // Full path, e.g. file_meta.cycle
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::string path {};
        for (const auto& key : yaml_keys) {
            path += (path.empty() ? "" : ".") + key;
        }
        return path;
    }
};

// Parameter holding a number, enum, or time point
template <typename T>
class Setting : public SettingBase
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase { yaml_keys, typeName<T>(), info }, value { value }
    {}
    operator T() const { return value; }
    auto operator=(const T& new_value) -> Setting&
    {
        value = new_value;
        return *this;
    }
};

// Parameter whose value is a base class of the parameter
template <typename Value>
class InheritedSetting
  : public SettingBase
  , public Value
{
public:
    InheritedSetting() = default;
    InheritedSetting(const std::vector<std::string>& yaml_keys,
                     const std::string& type,
                     const Value& value,
                     const std::string& info)
      : SettingBase { yaml_keys, type, info }, Value { value }
    {}
    // Assign to the value part only
    auto operator=(const Value& value) -> InheritedSetting&
    {
        static_cast<Value&>(*this) = value;
        return *this;
    }
};

template <>
class Setting<std::string> : public InheritedSetting<std::string>
{
public:
    using InheritedSetting<std::string>::operator=;
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string& value,
            const std::string& info)
      : InheritedSetting<std::string> { yaml_keys,
                                        typeName<std::string>(),
                                        value,
                                        info }
    {}
};

template <typename T>
class Setting<std::vector<T>> : public InheritedSetting<std::vector<T>>
{
public:
    using InheritedSetting<std::vector<T>>::operator=;
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T>& value,
            const std::string& info)
      : InheritedSetting<std::vector<T>> { yaml_keys,
                                           typeName<T>() + " list",
                                           value,
                                           info }
    {}
};

// No default value. Whether the parameter is required is decided when
// checking the parameters.
template <typename T>
class Setting<std::optional<T>> : public InheritedSetting<std::optional<T>>
{
public:
    using InheritedSetting<std::optional<T>>::operator=;
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys, const std::string& info)
      : InheritedSetting<std::optional<T>> { yaml_keys,
                                             typeName<T>(),
                                             std::nullopt,
                                             info }
    {}
};

} // namespace scorehv
