#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Error codes grouped by area:
//   File System    (1200-1299)
//   Configuration  (1500-1599)
//   Validation     (1600-1699)
//   System         (1700-1799)
enum class Code {
    FILE_NOT_FOUND = 1200,
    FILE_PERMISSION_DENIED = 1201,
    FILE_OPEN_FAILED = 1202,
    FILE_READ_FAILED = 1203,
    FILE_WRITE_FAILED = 1204,
    FILE_PATH_INVALID = 1205,

    CONFIG_LOAD_FAILED = 1500,
    CONFIG_SAVE_FAILED = 1501,
    CONFIG_INVALID_VALUE = 1502,

    VALIDATION_INVALID_INPUT = 1600,
    VALIDATION_EMPTY_FIELD = 1601,

    SYSTEM_INIT_FAILED = 1700
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "");

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // "Error <code>: <message> (<context>)" plus the resolution hint
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
