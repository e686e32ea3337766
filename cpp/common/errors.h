// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Kinds of errors raised while harvesting. All of them are fatal: a
// harvest either returns its complete result or fails with one of
// these. Each component catches failures at its boundary and rethrows
// them with context (file, metric, region/stat, configuration key)
// prepended to the message using rethrowWithContext.

#pragma once

#include <stdexcept>
#include <string>

namespace scorehv {

// Bad characters in a path, missing or empty file, no read permission
class PathError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Missing or invalid configuration parameter
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Cycle time outside of the allowed historical window
class TimeRangeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Unknown harvester name
class RegistryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// NetCDF file cannot be opened, variable missing, or array lengths
// disagree
class ExtractionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Rethrow the exception currently being handled with context
// prepended to its message. Must be called from within a catch
// block. Errors of the kinds above keep their kind while any other
// exception (yaml-cpp, netCDF, standard library) is converted to
// Default. Example:
//
//   try {
//       ...
//   } catch (const std::exception&) {
//       rethrowWithContext<ConfigError>("problem parsing regions");
//   }
template <typename Default>
[[noreturn]] auto rethrowWithContext(const std::string& context) -> void
{
    const std::string prefix { context + " - err: " };
    try {
        throw;
    } catch (const PathError& e) {
        throw PathError { prefix + e.what() };
    } catch (const ConfigError& e) {
        throw ConfigError { prefix + e.what() };
    } catch (const TimeRangeError& e) {
        throw TimeRangeError { prefix + e.what() };
    } catch (const RegistryError& e) {
        throw RegistryError { prefix + e.what() };
    } catch (const ExtractionError& e) {
        throw ExtractionError { prefix + e.what() };
    } catch (const std::exception& e) {
        throw Default { prefix + e.what() };
    }
}

} // namespace scorehv
