#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

struct CommandLineOptions {
    std::optional<std::string> path;
    std::vector<std::string> extensions;
    bool disable_eof_newline_normalization{false};
    bool ignore_case{false};
    bool check_only{false};
    bool save_config{false};
    std::optional<std::string> report_path;
    std::optional<std::string> config_path;
    std::optional<spdlog::level::level_enum> log_level;
    bool show_help{false};
    bool show_version{false};
};

/**
 * @brief Parses argv into CommandLineOptions.
 *
 * -e/--extensions takes one or more values up to the next option, may be
 * repeated and accepts comma separated lists. Throws ErrorCodes::AppException
 * (VALIDATION_INVALID_INPUT) on unknown options or missing values.
 */
CommandLineOptions parse_command_line(int argc, const char* const* argv);

std::string usage_text(const std::string& program_name);

#endif
