#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "ErrorCode.hpp"

#include <string>

using namespace ErrorCodes;

TEST_CASE("catalog entries carry a message and a resolution") {
    for (Code code : {Code::FILE_NOT_FOUND, Code::FILE_WRITE_FAILED, Code::FILE_PATH_INVALID,
                      Code::CONFIG_INVALID_VALUE, Code::VALIDATION_EMPTY_FIELD,
                      Code::SYSTEM_INIT_FAILED}) {
        const ErrorInfo info = ErrorCatalog::get_error_info(code);
        CHECK(info.code == code);
        CHECK_FALSE(info.message.empty());
        CHECK_FALSE(info.resolution.empty());
    }
}

TEST_CASE("full details include the numeric code and context") {
    const ErrorInfo info = ErrorCatalog::get_error_info(Code::FILE_READ_FAILED, "src/main.rs");
    const std::string details = info.get_full_details();
    CHECK(details.find("1203") != std::string::npos);
    CHECK(details.find("src/main.rs") != std::string::npos);
}

TEST_CASE("AppException what() combines message and context") {
    const AppException ex(Code::FILE_PERMISSION_DENIED, "locked.rs");
    CHECK(ex.get_error_code_int() == 1201);
    CHECK(std::string(ex.what()).find("locked.rs") != std::string::npos);
}

TEST_CASE("a custom message keeps the catalog resolution") {
    const AppException ex(Code::VALIDATION_INVALID_INPUT, "Unknown argument '-x'", "-x");
    CHECK(std::string(ex.what()) == "Unknown argument '-x' (-x)");
    CHECK(ex.get_error_info().resolution ==
          ErrorCatalog::get_error_info(Code::VALIDATION_INVALID_INPUT).resolution);
}

TEST_CASE("THROW_APP_ERROR throws AppException") {
    REQUIRE_THROWS_AS(THROW_APP_ERROR(Code::FILE_PATH_INVALID, "x"), AppException);
}
