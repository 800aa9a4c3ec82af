#include "doctest/doctest.h"
#include "Utils.hpp"
#include "TempDir.h"

TEST_SUITE_BEGIN("UtilsTest");

TEST_CASE("trim removes surrounding ASCII whitespace")
{
    std::string str = " \t#ffffff\r\n\v\f";
    trim(str);
    CHECK_EQ(str, "#ffffff");

    std::string empty = "   ";
    trim(empty);
    CHECK_EQ(empty, "");
}

TEST_CASE("toLower only folds ASCII letters")
{
    CHECK_EQ(toLower("#FfAa09"), "#ffaa09");
}

TEST_CASE("isAscii")
{
    CHECK(isAscii(""));
    CHECK(isAscii("#ffffff"));
    CHECK_FALSE(isAscii("\xc3\xa9"));
}

TEST_CASE("split keeps empty components")
{
    auto parts = split("a..b", '.');
    REQUIRE_EQ(parts.size(), 3);
    CHECK_EQ(parts[0], "a");
    CHECK_EQ(parts[1], "");
    CHECK_EQ(parts[2], "b");

    CHECK_EQ(split("abc", '.').size(), 1);
}

TEST_CASE("formatFloat prints the shortest round-trip representation")
{
    CHECK_EQ(formatFloat(255.0f), "255");
    CHECK_EQ(formatFloat(0.25f), "0.25");
    CHECK_EQ(formatFloat(0.0f), "0");
    CHECK_EQ(formatFloat(0.3239239f), "0.3239239");
    CHECK_EQ(formatFloat(0.0031308f), "0.0031308");
}

TEST_CASE("readFile reads an entire file")
{
    TempDir t("wcag_contrast_read_file");
    auto path = t.write_child("settings.json", "{\"a\": 1}");

    CHECK_EQ(readFile(path).value_or(""), "{\"a\": 1}");
    CHECK_FALSE(readFile(t.path() + "/missing.json").has_value());
}

TEST_CASE("readFile does not read directories")
{
    TempDir t("wcag_contrast_read_directory");

    CHECK_FALSE(readFile(t.path()).has_value());
}

TEST_SUITE_END();
