#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "CommandLine.hpp"

#include <string>
#include <vector>

namespace {

CommandLineOptions parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "strip-trailing-whitespace");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("path and extensions are parsed") {
    const auto options = parse({"-p", "src", "-e", "rs", "py", "--extensions", "toml,.md"});
    REQUIRE(options.path.has_value());
    CHECK(*options.path == "src");
    CHECK(options.extensions == std::vector<std::string>{"rs", "py", "toml", "md"});
    CHECK_FALSE(options.disable_eof_newline_normalization);
    CHECK_FALSE(options.check_only);
}

TEST_CASE("flags are recognised in short and long form") {
    const auto short_form = parse({"-d", "-i", "-c", "-v"});
    CHECK(short_form.disable_eof_newline_normalization);
    CHECK(short_form.ignore_case);
    CHECK(short_form.check_only);
    CHECK(short_form.log_level == spdlog::level::debug);

    const auto long_form = parse({"--disable-eof-newline-normalization", "--ignore-case",
                                  "--check", "--quiet", "--save-config"});
    CHECK(long_form.disable_eof_newline_normalization);
    CHECK(long_form.ignore_case);
    CHECK(long_form.check_only);
    CHECK(long_form.save_config);
    CHECK(long_form.log_level == spdlog::level::warn);
}

TEST_CASE("report and config paths take a value") {
    const auto options = parse({"--report", "out.json", "--config", "my.ini"});
    CHECK(options.report_path == std::optional<std::string>("out.json"));
    CHECK(options.config_path == std::optional<std::string>("my.ini"));
}

TEST_CASE("help and version do not need other options") {
    CHECK(parse({"--help"}).show_help);
    CHECK(parse({"-V"}).show_version);
}

TEST_CASE("an option missing its value is an error") {
    try {
        parse({"-p"});
        FAIL("expected an exception");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::VALIDATION_INVALID_INPUT);
    }
    REQUIRE_THROWS_AS(parse({"-e", "-d"}), ErrorCodes::AppException);
}

TEST_CASE("unknown arguments are rejected") {
    REQUIRE_THROWS_AS(parse({"--frobnicate"}), ErrorCodes::AppException);
    REQUIRE_THROWS_AS(parse({"stray"}), ErrorCodes::AppException);
}

TEST_CASE("usage text lists every option") {
    const std::string usage = usage_text("stw");
    for (const char* option : {"--path", "--extensions", "--disable-eof-newline-normalization",
                               "--ignore-case", "--check", "--report", "--config",
                               "--save-config", "--verbose", "--quiet", "--help", "--version"}) {
        CHECK(usage.find(option) != std::string::npos);
    }
    CHECK(usage.rfind("Usage: stw", 0) == 0);
}
