#include "doctest/doctest.h"
#include "Color/Luminance.hpp"
#include "Color/IostreamHelpers.hpp"

using namespace wcag;

static const Color white = Color::fromChannels(255, 255, 255);
static const Color black = Color::fromChannels(0, 0, 0);

TEST_SUITE_BEGIN("Luminance");

TEST_CASE("linearize uses the linear segment up to the threshold")
{
    CHECK_EQ(linearize(0.0f), 0.0f);
    CHECK_EQ(linearize(0.04045f), doctest::Approx(0.04045 / 12.92));
    CHECK_EQ(linearize(0.02f), doctest::Approx(0.02 / 12.92));
}

TEST_CASE("linearize uses the power segment above the threshold")
{
    CHECK_EQ(linearize(1.0f), doctest::Approx(1.0));
    CHECK_EQ(linearize(0.5f), doctest::Approx(0.214041));
    CHECK_EQ(linearize(0.05f), doctest::Approx(0.003935).epsilon(1e-3));
}

TEST_CASE("relative luminance of white and black")
{
    CHECK_EQ(relativeLuminance(white), doctest::Approx(1.0));
    CHECK_EQ(relativeLuminance(black), 0.0f);
}

TEST_CASE("relative luminance weights the primaries")
{
    CHECK_EQ(relativeLuminance(Color::fromChannels(255, 0, 0)), doctest::Approx(0.2126));
    CHECK_EQ(relativeLuminance(Color::fromChannels(0, 255, 0)), doctest::Approx(0.7152));
    CHECK_EQ(relativeLuminance(Color::fromChannels(0, 0, 255)), doctest::Approx(0.0722));
}

TEST_CASE("relative luminance of a mid tone")
{
    CHECK_EQ(relativeLuminance(Color::fromChannels(242, 108, 167)), doctest::Approx(0.323924));
    CHECK_EQ(relativeLuminance(Color::fromHex("#777777")), doctest::Approx(0.184475));
}

TEST_CASE("contrast of a color with itself is 1")
{
    CHECK_EQ(contrastRatio(white, white), doctest::Approx(1.0));
    CHECK_EQ(contrastRatio(black, black), doctest::Approx(1.0));
}

TEST_CASE("black on white is the maximum contrast")
{
    CHECK_EQ(contrastRatio(black, white), doctest::Approx(21.0));
}

TEST_CASE("contrast ratio is symmetric")
{
    auto target = Color::fromChannels(242, 108, 167);
    CHECK_EQ(contrastRatio(target, white), contrastRatio(white, target));
    CHECK_EQ(contrastRatio(target, white), doctest::Approx(2.808058));

    for (int i = 0; i < 256; i += 15)
    {
        auto a = Color::fromChannels(uint8_t(i), uint8_t(255 - i), uint8_t(i / 2));
        auto b = Color::fromChannels(uint8_t(i / 3), uint8_t(i), uint8_t(255 - i / 2));
        CHECK_EQ(contrastRatio(a, b), contrastRatio(b, a));
        CHECK_GE(contrastRatio(a, b), 1.0f);
    }
}

TEST_CASE("widening the luminance gap increases contrast")
{
    float previous = contrastRatio(black, black);
    for (int level = 1; level < 256; level++)
    {
        auto gray = Color::fromChannels(uint8_t(level), uint8_t(level), uint8_t(level));
        float ratio = contrastRatio(black, gray);
        CHECK_GT(ratio, previous);
        previous = ratio;
    }
}

TEST_CASE("conformance thresholds")
{
    CHECK_EQ(minimumContrastRatio(ConformanceLevel::AALargeText), 3.0f);
    CHECK_EQ(minimumContrastRatio(ConformanceLevel::AA), 4.5f);
    CHECK_EQ(minimumContrastRatio(ConformanceLevel::AAALargeText), 4.5f);
    CHECK_EQ(minimumContrastRatio(ConformanceLevel::AAA), 7.0f);

    CHECK(meetsConformance(4.5f, ConformanceLevel::AA));
    CHECK_FALSE(meetsConformance(4.49f, ConformanceLevel::AA));
}

TEST_CASE("gray on white sits on either side of AA")
{
    auto failing = evaluateConformance(contrastRatio(Color::fromHex("#777777"), white));
    CHECK_FALSE(failing.aaNormalText);
    CHECK(failing.aaLargeText);
    CHECK_FALSE(failing.aaaNormalText);
    CHECK_FALSE(failing.aaaLargeText);

    auto passing = evaluateConformance(contrastRatio(Color::fromHex("#767676"), white));
    CHECK(passing.aaNormalText);
    CHECK(passing.aaLargeText);
    CHECK_FALSE(passing.aaaNormalText);
    CHECK(passing.aaaLargeText);
}

TEST_CASE("black on white meets every level")
{
    auto conformance = evaluateConformance(contrastRatio(black, white));
    CHECK(conformance.aaNormalText);
    CHECK(conformance.aaLargeText);
    CHECK(conformance.aaaNormalText);
    CHECK(conformance.aaaLargeText);
}

TEST_SUITE_END();
