// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Console output of the harvester and file path checks

#pragma once

#include <spdlog/pattern_formatter.h>
#include <string>
#include <vector>

namespace scorehv {

// The %* flag: empty for info messages, [warning], [error] or [debug]
// otherwise
class scorehv_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// The default logger prints "[hh:mm:ss] message" with the %* label.
// The logger named plain prints the message only and is used for
// headings and harvested data. Safe to call more than once.
auto initLogging(
  const spdlog::level::level_enum level = spdlog::level::info) -> void;

// Boxed section title, e.g.
//
// ##############
// # Harvesting #
// ##############
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// How the executable was built. Filled from compile definitions.
struct BuildInfo
{
    std::string version {};
    // GITDIR-N if not built from a git checkout
    std::string git_commit {};
    std::string host_system {};
    std::string executable {};
    std::string compiler {};
    std::string compiler_flags {};
    // Space separated
    std::string libraries {};
};

auto printSystemInfo(const BuildInfo& build_info) -> void;

// Throws PathError unless filename consists of [A-Za-z0-9._/-] only
// and names an existing, non-empty, readable regular file
auto checkReadableFile(const std::string& filename) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

auto replaceAll(std::string str,
                const std::string& from,
                const std::string& to) -> std::string;

} // namespace scorehv
