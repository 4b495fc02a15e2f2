#include "Application.hpp"
#include "AppException.hpp"
#include "DiskFileStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <app_version.hpp>

#include <cstdio>
#include <filesystem>
#include <string>


void apply_overrides(const CommandLineOptions& options, Settings& settings)
{
    if (!options.extensions.empty()) {
        settings.set_extensions(options.extensions);
    }
    if (options.disable_eof_newline_normalization) {
        settings.set_eof_newline_normalization(false);
    }
    if (options.ignore_case) {
        settings.set_case_sensitive_extensions(false);
    }
    if (options.log_level) {
        settings.set_log_level(*options.log_level);
    }
}


RunOptions build_run_options(const CommandLineOptions& options, const Settings& settings)
{
    if (!options.path || options.path->empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_EMPTY_FIELD,
                            "Missing required option --path", "--path");
    }
    const auto extensions = settings.get_extensions();
    if (extensions.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_EMPTY_FIELD,
                            "No extensions selected; pass --extensions or set [Normalization] Extensions",
                            "--extensions");
    }

    RunOptions run_options;
    run_options.selection.root = Utils::utf8_to_path(*options.path);
    run_options.selection.extensions.insert(extensions.begin(), extensions.end());
    run_options.selection.case_sensitive = settings.get_case_sensitive_extensions();
    run_options.normalization.eof_newline_normalization = settings.get_eof_newline_normalization();
    run_options.check_only = options.check_only;
    return run_options;
}


int exit_code_for(const RunReport& report, bool report_failed)
{
    const bool needs_attention = report.has_failures()
        || report_failed
        || (report.check_only() && report.has_changes());
    return needs_attention ? kExitNeedsAttention : kExitSuccess;
}


int run_application(int argc, const char* const* argv, std::ostream& out)
{
    const CommandLineOptions options = parse_command_line(argc, argv);
    const std::string program_name = argc > 0
        ? Utils::path_to_utf8(std::filesystem::path(argv[0]).filename())
        : std::string("strip-trailing-whitespace");

    if (options.show_help) {
        out << usage_text(program_name);
        return kExitSuccess;
    }
    if (options.show_version) {
        out << program_name << " " << APP_VERSION.to_string() << std::endl;
        return kExitSuccess;
    }

    Settings settings(options.config_path.value_or(""));
    if (!settings.load()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, settings.get_config_path());
    }
    apply_overrides(options, settings);

    Logger::set_level(settings.get_log_level());
    if (settings.get_log_to_file() && !Logger::add_file_sink(settings.get_log_dir())) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Continuing with console logging only");
        }
    }
    if (options.save_config) {
        settings.save();
    }

    const RunOptions run_options = build_run_options(options, settings);
    DiskFileStore store;
    NormalizationRunner runner(run_options, store);
    const RunReport report = runner.run();

    bool report_failed = false;
    if (options.report_path) {
        try {
            report.save(Utils::utf8_to_path(*options.report_path));
        } catch (const ErrorCodes::AppException& ex) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Cannot write run report: {}", ex.what());
            }
            report_failed = true;
        }
    }
    return exit_code_for(report, report_failed);
}


int guarded_run_application(int argc, const char* const* argv, std::ostream& out)
{
    try {
        return run_application(argc, argv, out);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.what());
            logger->error("{}", ex.get_error_info().resolution);
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
    }
    return kExitUsageError;
}
