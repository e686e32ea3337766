// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <string>

namespace scorehv {

// Harvest using a configuration file and print the harvested data
auto driver(const std::string& config_file) -> void;

} // namespace scorehv
