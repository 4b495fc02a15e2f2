#include <catch2/catch_test_macros.hpp>
#include "Logger.hpp"
#include "Utils.hpp"

#include <optional>
#include <string>
#include <vector>

TEST_CASE("split_list trims items and drops empty ones") {
    CHECK(Utils::split_list(" rs, py ,,\tcpp ") == std::vector<std::string>{"rs", "py", "cpp"});
    CHECK(Utils::split_list("").empty());
}

TEST_CASE("parse_bool accepts common spellings") {
    CHECK(Utils::parse_bool("TRUE") == std::optional<bool>(true));
    CHECK(Utils::parse_bool(" yes ") == std::optional<bool>(true));
    CHECK(Utils::parse_bool("0") == std::optional<bool>(false));
    CHECK(Utils::parse_bool("Off") == std::optional<bool>(false));
    CHECK_FALSE(Utils::parse_bool("maybe").has_value());
}

TEST_CASE("normalize_extension strips a single leading dot") {
    CHECK(Utils::normalize_extension(".rs") == "rs");
    CHECK(Utils::normalize_extension(" py ") == "py");
    CHECK(Utils::normalize_extension("..x") == ".x");
    CHECK(Utils::normalize_extension(".").empty());
}

TEST_CASE("to_lower_ascii leaves non-ASCII bytes alone") {
    CHECK(Utils::to_lower_ascii("MiXeD.RS") == "mixed.rs");
    CHECK(Utils::to_lower_ascii("\xC3\x84") == "\xC3\x84");
}

TEST_CASE("paths round trip through UTF-8") {
    const std::string name = "caf\xC3\xA9/notes.md";
    CHECK(Utils::path_to_utf8(Utils::utf8_to_path(name)) == name);
}

TEST_CASE("parse_level knows spdlog level names") {
    CHECK(Logger::parse_level("debug") == std::optional<spdlog::level::level_enum>(spdlog::level::debug));
    CHECK(Logger::parse_level("warning") == std::optional<spdlog::level::level_enum>(spdlog::level::warn));
    CHECK_FALSE(Logger::parse_level("verbose").has_value());
}

TEST_CASE("setup_loggers replaces core_logger without raising SYSTEM_INIT_FAILED") {
    const auto previous = Logger::get_logger("core_logger");
    REQUIRE_NOTHROW(Logger::setup_loggers());
    REQUIRE_NOTHROW(Logger::setup_loggers());

    const auto current = Logger::get_logger("core_logger");
    REQUIRE(current != nullptr);
    CHECK(current != previous);
    CHECK(current->level() == spdlog::level::info);
    Logger::set_level(spdlog::level::off);
}
