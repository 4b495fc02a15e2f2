#include "CommandLine.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <cstring>

#include <fmt/format.h>

namespace {

bool is_option(const char* arg)
{
    return arg[0] == '-' && arg[1] != '\0';
}

bool matches(const char* arg, const char* short_name, const char* long_name)
{
    return (short_name != nullptr && std::strcmp(arg, short_name) == 0)
        || std::strcmp(arg, long_name) == 0;
}

std::string require_value(int argc, const char* const* argv, int& index)
{
    if (index + 1 >= argc || is_option(argv[index + 1])) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            fmt::format("Option {} requires a value", argv[index]),
                            argv[index]);
    }
    ++index;
    return argv[index];
}

void append_extensions(const std::string& value, std::vector<std::string>& out)
{
    for (const auto& item : Utils::split_list(value)) {
        std::string extension = Utils::normalize_extension(item);
        if (!extension.empty()) {
            out.push_back(std::move(extension));
        }
    }
}

} // namespace


CommandLineOptions parse_command_line(int argc, const char* const* argv)
{
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (matches(arg, "-h", "--help")) {
            options.show_help = true;
        } else if (matches(arg, "-V", "--version")) {
            options.show_version = true;
        } else if (matches(arg, "-p", "--path")) {
            options.path = require_value(argc, argv, i);
        } else if (matches(arg, "-e", "--extensions")) {
            append_extensions(require_value(argc, argv, i), options.extensions);
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                append_extensions(argv[++i], options.extensions);
            }
        } else if (matches(arg, "-d", "--disable-eof-newline-normalization")) {
            options.disable_eof_newline_normalization = true;
        } else if (matches(arg, "-i", "--ignore-case")) {
            options.ignore_case = true;
        } else if (matches(arg, "-c", "--check")) {
            options.check_only = true;
        } else if (matches(arg, nullptr, "--report")) {
            options.report_path = require_value(argc, argv, i);
        } else if (matches(arg, nullptr, "--config")) {
            options.config_path = require_value(argc, argv, i);
        } else if (matches(arg, nullptr, "--save-config")) {
            options.save_config = true;
        } else if (matches(arg, "-v", "--verbose")) {
            options.log_level = spdlog::level::debug;
        } else if (matches(arg, "-q", "--quiet")) {
            options.log_level = spdlog::level::warn;
        } else {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                fmt::format("Unknown argument '{}'", arg),
                                arg);
        }
    }

    return options;
}


std::string usage_text(const std::string& program_name)
{
    return fmt::format(
        "Usage: {} -p <dir> -e <ext> [-e <ext> ...] [options]\n"
        "\n"
        "Strips trailing whitespace from every line and collapses trailing blank\n"
        "lines at end of file in the selected files.\n"
        "\n"
        "Options:\n"
        "  -p, --path <dir>                          Root directory (or single file) to clean\n"
        "  -e, --extensions <ext>[,<ext>] [<ext>...] File extensions to select, without the dot\n"
        "  -d, --disable-eof-newline-normalization   Keep trailing blank lines at end of file\n"
        "  -i, --ignore-case                         Match extensions ignoring ASCII case\n"
        "  -c, --check                               Report files that would change, write nothing\n"
        "      --report <file>                       Write a JSON report of the run\n"
        "      --config <file>                       Read settings from this INI file\n"
        "      --save-config                         Store the effective settings in the INI file\n"
        "  -v, --verbose                             Log unchanged files and traversal details\n"
        "  -q, --quiet                               Log warnings and errors only\n"
        "  -h, --help                                Show this help\n"
        "  -V, --version                             Show the version\n"
        "\n"
        "Exit status: 0 on success, 1 when a file failed (or would change with --check),\n"
        "2 on usage or configuration errors.\n",
        program_name);
}
