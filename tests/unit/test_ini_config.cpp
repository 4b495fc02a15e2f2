#include <catch2/catch_test_macros.hpp>
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <vector>

TEST_CASE("sections, comments and whitespace are parsed") {
    IniConfig config;
    config.parse(
        "; leading comment\n"
        "# another comment\n"
        "[Normalization]\n"
        "  Extensions =  rs, py   ; inline comment\n"
        "EofNewlineNormalization=false\n"
        "\n"
        "[ Logging ]\n"
        "Level = debug # trailing\n");

    CHECK(config.getValue("Normalization", "Extensions") == "rs, py");
    CHECK(config.getValue("Normalization", "EofNewlineNormalization") == "false");
    CHECK(config.getValue("Logging", "Level") == "debug");
    CHECK(config.sections() == std::vector<std::string>{"Logging", "Normalization"});
}

TEST_CASE("a marker without leading whitespace is part of the value") {
    IniConfig config;
    config.parse("[Languages]\nName = C#\n");
    CHECK(config.getValue("Languages", "Name") == "C#");
}

TEST_CASE("missing keys fall back to the default") {
    IniConfig config;
    config.parse("[Normalization]\nExtensions = rs\n");
    CHECK_FALSE(config.hasValue("Normalization", "Missing"));
    CHECK(config.getValue("Normalization", "Missing", "fallback") == "fallback");
    CHECK(config.getValue("Nowhere", "Extensions", "x") == "x");
}

TEST_CASE("malformed lines are skipped") {
    IniConfig config;
    config.parse("[S]\nnot a pair\n= no key\nkey = value\n");
    CHECK(config.getValue("S", "key") == "value");
    CHECK_FALSE(config.hasValue("S", ""));
}

TEST_CASE("save and load round trip through a file") {
    TempDir temp_dir;
    const auto path = (temp_dir.path() / "config.ini").string();

    IniConfig original;
    original.setValue("Normalization", "Extensions", "rs, py");
    original.setValue("Logging", "LogToFile", "false");
    REQUIRE(original.save(path));

    IniConfig loaded;
    REQUIRE(loaded.load(path));
    CHECK(loaded.getValue("Normalization", "Extensions") == "rs, py");
    CHECK(loaded.getValue("Logging", "LogToFile") == "false");
}

TEST_CASE("loading a missing file fails") {
    TempDir temp_dir;
    IniConfig config;
    CHECK_FALSE(config.load((temp_dir.path() / "absent.ini").string()));
}
