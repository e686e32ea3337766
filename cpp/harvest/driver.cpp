// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"

#include "harvest.h"

#include <common/io.h>
#include <spdlog/spdlog.h>

namespace scorehv {

// Print a table row by row in the same layout as the records
static auto printTable(const HarvestedTable& table) -> void
{
    std::string header {};
    for (const auto& column : HarvestedTable::columnNames()) {
        header += (header.empty() ? "" : " ") + column;
    }
    spdlog::get("plain")->info(header);
    for (long int i {}; i < table.size(); ++i) {
        spdlog::get("plain")->info("{} {} {} {} {} {} {} {} {}",
                                   table.filename[i],
                                   timeToString(table.cycletime[i]),
                                   table.region_name[i],
                                   table.region_bounds[i],
                                   table.elevation(i),
                                   table.elevation_unit[i],
                                   table.metric[i],
                                   table.stat[i],
                                   table.value(i));
    }
}

auto driver(const std::string& config_file) -> void
{
    // Set up loggers and print general information
    initLogging();
    printHeading("Innovation statistics harvester", false);
    BuildInfo build_info {};
    build_info.version = SCOREHV_PROJECT_VERSION;
    build_info.git_commit = SCOREHV_GIT_COMMIT_ABBREV;
    build_info.host_system = SCOREHV_CMAKE_HOST_SYSTEM;
    build_info.executable = SCOREHV_EXECUTABLE;
    build_info.compiler = SCOREHV_CXX_COMPILER;
    build_info.compiler_flags = SCOREHV_CXX_COMPILER_FLAGS;
    build_info.libraries = SCOREHV_LIBRARIES;
    printSystemInfo(build_info);

    printHeading("Harvesting");
    checkReadableFile(config_file);
    const HarvestResult result { harvestFile(config_file) };

    printHeading("Harvested data");
    if (const auto* records { std::get_if<std::vector<HarvestedData>>(
          &result) }) {
        for (const auto& record : *records) {
            spdlog::get("plain")->info(recordToString(record));
        }
    } else {
        printTable(std::get<HarvestedTable>(result));
    }

    printHeading("Success");
    spdlog::info("Harvested {} records from {}",
                 resultSize(result),
                 config_file);
}

} // namespace scorehv
