#include "ErrorCode.hpp"

#include <unordered_map>
#include <utility>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::FILE_NOT_FOUND,
         {"The file could not be found.",
          "Check that the file still exists and was not moved during the run."}},
        {Code::FILE_PERMISSION_DENIED,
         {"Permission to access the file was denied.",
          "Check the file permissions or run with an account that may modify it."}},
        {Code::FILE_OPEN_FAILED,
         {"The file could not be opened.",
          "Make sure no other program holds the file locked."}},
        {Code::FILE_READ_FAILED,
         {"The file could not be read.",
          "Check that the file is readable and the disk is healthy."}},
        {Code::FILE_WRITE_FAILED,
         {"The file could not be written.",
          "Check free disk space and write permissions on the containing directory."}},
        {Code::FILE_PATH_INVALID,
         {"The path is not valid.",
          "Pass an existing directory or regular file."}},
        {Code::CONFIG_LOAD_FAILED,
         {"The configuration file could not be loaded.",
          "Check that the configuration file exists and is readable."}},
        {Code::CONFIG_SAVE_FAILED,
         {"The configuration file could not be saved.",
          "Check write permissions on the configuration directory."}},
        {Code::CONFIG_INVALID_VALUE,
         {"The configuration contains an invalid value.",
          "Fix the reported key in the configuration file."}},
        {Code::VALIDATION_INVALID_INPUT,
         {"Invalid command line input.",
          "Run with --help to see the accepted options."}},
        {Code::VALIDATION_EMPTY_FIELD,
         {"A required value is missing.",
          "Run with --help to see the required options."}},
        {Code::SYSTEM_INIT_FAILED,
         {"Initialization failed.",
          "Check the log output for details."}},
    };
    return entries;
}

} // namespace

ErrorInfo::ErrorInfo(Code code, std::string message, std::string resolution, std::string context)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      context(std::move(context))
{
}

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + " " + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = "Error " + std::to_string(static_cast<int>(code)) + ": " + message;
    if (!context.empty()) {
        details += " (" + context + ")";
    }
    if (!resolution.empty()) {
        details += "\nResolution: " + resolution;
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    const auto it = entries.find(code);
    if (it == entries.end()) {
        return ErrorInfo(code, "An unknown error occurred.", "", context);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

} // namespace ErrorCodes
