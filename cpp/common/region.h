// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A named latitude band spanning all longitudes. Statistics in the
// innovation files are aggregated over such bands.

#pragma once

#include <array>
#include <string>
#include <vector>

namespace scorehv {

// Longitude and latitude of a vertex of a region boundary
struct Vertex
{
    double lon {};
    double lat {};
};

class Region
{
private:
    std::string region_name {};
    double min_lat {};
    double max_lat {};
    // Closed boundary NW, NE, SE, SW, NW
    std::array<Vertex, 5> vertices {};
    // String representation of the boundary, copied into every record
    std::string grid_str {};

public:
    // Throws ConfigError if the name is empty, a bound is not finite,
    // min_lat > max_lat, or a bound is outside [-90, 90].
    Region(const std::string& name, const double min_lat, const double max_lat);
    [[nodiscard]] auto name() const -> const std::string&
    {
        return region_name;
    }
    [[nodiscard]] auto minLat() const -> double { return min_lat; }
    [[nodiscard]] auto maxLat() const -> double { return max_lat; }
    [[nodiscard]] auto boundary() const -> const std::array<Vertex, 5>&
    {
        return vertices;
    }
    // ((-180,max),(180,max),(180,min),(-180,min),(-180,max))
    [[nodiscard]] auto grid() const -> const std::string& { return grid_str; }
};

// equatorial, global, north_hemis, tropics, south_hemis
auto defaultRegions() -> std::vector<Region>;

} // namespace scorehv
