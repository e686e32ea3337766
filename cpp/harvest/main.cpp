// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// scorehv_harvest               print the default configuration
// scorehv_harvest config.yaml   harvest and print the records

#include "driver.h"
#include "settings_innov.h"

#include <cstdlib>
#include <iostream>

auto main(int argc, char* argv[]) -> int
{
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.yaml]\n";
        return EXIT_FAILURE;
    }
    if (argc == 1) {
        std::cout << "%YAML 1.2\n---\n"
                  << scorehv::SettingsInnovStats {}.dumpConfig() << '\n';
        return EXIT_SUCCESS;
    }
    // Failures are not caught and end the process with a non-zero status
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    scorehv::driver(argv[1]);
    return EXIT_SUCCESS;
}
