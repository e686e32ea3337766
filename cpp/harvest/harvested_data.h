// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Output of a harvest. One record is produced per metric, region,
// statistic and elevation level. Records can be coalesced into a
// column oriented table.

#pragma once

#include <Eigen/Dense>
#include <common/time.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scorehv {

struct HarvestedData
{
    // Record name innov_stats_<metric>_<stat>. Not set by the first
    // generation harvester.
    std::optional<std::string> filename {};
    TimePoint cycletime {};
    std::string region_name {};
    double region_min_lat {};
    double region_max_lat {};
    std::string region_bounds {};
    double elevation {};
    std::string elevation_unit {};
    std::string metric {};
    std::string stat {};
    double value {};

    auto operator==(const HarvestedData&) const -> bool = default;
};

// One column per record field
struct HarvestedTable
{
    std::vector<std::string> filename {};
    std::vector<TimePoint> cycletime {};
    std::vector<std::string> region_name {};
    std::vector<std::string> region_bounds {};
    Eigen::ArrayXd elevation {};
    std::vector<std::string> elevation_unit {};
    std::vector<std::string> metric {};
    std::vector<std::string> stat {};
    Eigen::ArrayXd value {};

    [[nodiscard]] static auto columnNames() -> std::vector<std::string>;
    // Number of rows
    [[nodiscard]] auto size() const -> long int { return value.size(); }
};

using HarvestResult = std::variant<std::vector<HarvestedData>, HarvestedTable>;

// Coalesce records into columns. A record without a name contributes
// an empty filename.
auto toTable(const std::vector<HarvestedData>& records) -> HarvestedTable;

// Number of records or table rows
auto resultSize(const HarvestResult& result) -> long int;

// One line summary of a record for printing
auto recordToString(const HarvestedData& record) -> std::string;

} // namespace scorehv
