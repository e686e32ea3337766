// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "harvested_data.h"

#include <spdlog/fmt/fmt.h>

namespace scorehv {

auto HarvestedTable::columnNames() -> std::vector<std::string>
{
    return { "filename",       "cycletime", "region_name",
             "region_bounds",  "elevation", "elevation_unit",
             "metric",         "stat",      "value" };
}

auto toTable(const std::vector<HarvestedData>& records) -> HarvestedTable
{
    HarvestedTable table {};
    const auto n_rows { static_cast<long int>(records.size()) };
    table.elevation.resize(n_rows);
    table.value.resize(n_rows);
    for (long int i {}; i < n_rows; ++i) {
        const auto& record { records[i] };
        table.filename.push_back(record.filename.value_or(""));
        table.cycletime.push_back(record.cycletime);
        table.region_name.push_back(record.region_name);
        table.region_bounds.push_back(record.region_bounds);
        table.elevation(i) = record.elevation;
        table.elevation_unit.push_back(record.elevation_unit);
        table.metric.push_back(record.metric);
        table.stat.push_back(record.stat);
        table.value(i) = record.value;
    }
    return table;
}

auto resultSize(const HarvestResult& result) -> long int
{
    if (const auto* records { std::get_if<std::vector<HarvestedData>>(
          &result) }) {
        return static_cast<long int>(records->size());
    }
    return std::get<HarvestedTable>(result).size();
}

auto recordToString(const HarvestedData& record) -> std::string
{
    return fmt::format("{} {} {} {} {} {} {} {} {}",
                       record.filename.value_or("-"),
                       timeToString(record.cycletime),
                       record.region_name,
                       record.region_bounds,
                       record.elevation,
                       record.elevation_unit,
                       record.metric,
                       record.stat,
                       record.value);
}

} // namespace scorehv
