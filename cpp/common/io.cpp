// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include "errors.h"
#include "time.h"

#include <filesystem>
#include <regex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace scorehv {

static auto levelLabel(const spdlog::level::level_enum level)
  -> std::string_view
{
    switch (level) {
    case spdlog::level::info:
        return "";
    case spdlog::level::warn:
        return " [warning]";
    case spdlog::level::err:
        return " [error]";
    case spdlog::level::debug:
        return " [debug]";
    default:
        return " [unknown]";
    }
}

auto scorehv_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                    const std::tm& /* tm_time */,
                                    spdlog::memory_buf_t& dest) -> void
{
    const std::string_view label { levelLabel(log_msg.level) };
    dest.append(label.data(), label.data() + label.size());
}

auto scorehv_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<scorehv_formatter_flag>();
}

auto initLogging(const spdlog::level::level_enum level) -> void
{
    if (spdlog::get("plain") == nullptr) {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<scorehv_formatter_flag>('*').set_pattern(
          "[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        spdlog::stdout_color_mt("plain")->set_pattern("%v");
    }
    spdlog::set_level(level);
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    const auto plain { spdlog::get("plain") };
    if (incl_empty_line) {
        plain->info("");
    }
    const std::string border(heading.size() + 4, '#');
    plain->info(border);
    plain->info("# {} #", heading);
    plain->info(border);
}

auto printSystemInfo(const BuildInfo& build_info) -> void
{
    const auto plain { spdlog::get("plain") };
    std::vector<std::pair<std::string, std::string>> lines {
        { "Version", build_info.version },
    };
    if (build_info.git_commit != "GITDIR-N") {
        lines.emplace_back("Commit hash", build_info.git_commit);
    }
    lines.emplace_back("Date and timezone", getDate());
    lines.emplace_back("Host system", build_info.host_system);
    lines.emplace_back("Executable location", build_info.executable);
    lines.emplace_back("C++ compiler", build_info.compiler);
    lines.emplace_back("C++ compiler flags", build_info.compiler_flags);
    for (const auto& [label, value] : lines) {
        plain->info("{:<24}: {}", label, value);
    }
    // One library per line, aligned under the first one
    const auto libraries { splitString(build_info.libraries, ' ') };
    for (size_t i {}; i < libraries.size(); ++i) {
        plain->info("{:<24}{} {}",
                    i == 0 ? "Linking against" : "",
                    i == 0 ? ":" : " ",
                    libraries[i]);
    }
}

auto checkReadableFile(const std::string& filename) -> void
{
    static const std::regex invalid_chars { R"([^A-Za-z0-9._/\-])" };
    if (std::regex_search(filename, invalid_chars)) {
        throw PathError { "Invalid characters found in file path: " + filename
                          + " (only a-z A-Z 0-9 and - . / _ are allowed)" };
    }
    std::error_code ec {};
    if (!std::filesystem::is_regular_file(filename, ec)) {
        throw PathError { "Path: " + filename + " does not exist" };
    }
    if (std::filesystem::file_size(filename, ec) == 0 || ec) {
        throw PathError { "Invalid file. File " + filename + " is empty." };
    }
    if (access(filename.c_str(), R_OK) != 0) {
        throw PathError { "Insufficient permissions on file \"" + filename
                          + "\"" };
    }
}

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>
{
    std::vector<std::string> items {};
    std::istringstream stream { list };
    for (std::string item {}; std::getline(stream, item, delimiter);) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

auto replaceAll(std::string str,
                const std::string& from,
                const std::string& to) -> std::string
{
    if (from.empty()) {
        return str;
    }
    for (size_t pos { str.find(from) }; pos != std::string::npos;
         pos = str.find(from, pos + to.size())) {
        str.replace(pos, from.size(), to);
    }
    return str;
}

} // namespace scorehv
