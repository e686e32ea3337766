// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "region.h"

#include "constants.h"
#include "errors.h"

#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <sstream>

namespace scorehv {

// Shortest text that reads back as the same latitude, always with a
// decimal point: 5.0, -22.5, 45.123456789
static auto boundToStr(const double bound) -> std::string
{
    std::string str { fmt::format("{}", bound) };
    if (str.find_first_of(".e") == std::string::npos) {
        str += ".0";
    }
    return str;
}

Region::Region(const std::string& name,
               const double min_lat,
               const double max_lat)
  : region_name { name }, min_lat { min_lat }, max_lat { max_lat }
{
    if (name.empty()) {
        throw ConfigError { "region name must not be empty" };
    }
    if (!std::isfinite(min_lat) || !std::isfinite(max_lat)) {
        throw ConfigError { "region " + name
                            + ": latitude bounds must be finite numbers" };
    }
    if (min_lat > max_lat) {
        throw ConfigError { "region " + name + ": min_lat ("
                            + boundToStr(min_lat)
                            + ") must be less than or equal to max_lat ("
                            + boundToStr(max_lat) + ")" };
    }
    if (min_lat < geo::min_lat || max_lat > geo::max_lat) {
        throw ConfigError { "region " + name + ": latitude bounds ("
                            + boundToStr(min_lat) + ", " + boundToStr(max_lat)
                            + ") must be within [-90, 90]" };
    }
    constexpr double west { geo::min_lon };
    constexpr double east { geo::max_lon };
    vertices = { { { west, max_lat },
                   { east, max_lat },
                   { east, min_lat },
                   { west, min_lat },
                   { west, max_lat } } };
    // Longitudes are whole degrees and printed as integers
    std::ostringstream grid {};
    grid << '(';
    for (bool first { true }; const auto& vertex : vertices) {
        if (!first) {
            grid << ',';
        }
        first = false;
        grid << '(' << static_cast<int>(vertex.lon) << ','
             << boundToStr(vertex.lat) << ')';
    }
    grid << ')';
    grid_str = grid.str();
}

auto defaultRegions() -> std::vector<Region>
{
    return { { "equatorial", -5.0, 5.0 },
             { "global", -90.0, 90.0 },
             { "north_hemis", 20.0, 60.0 },
             { "tropics", -20.0, 20.0 },
             { "south_hemis", -60.0, -20.0 } };
}

} // namespace scorehv
