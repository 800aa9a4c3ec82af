#include "doctest/doctest.h"
#include "Color/HexDecoder.hpp"
#include "Color/IostreamHelpers.hpp"

using namespace wcag;

static HexDecodeError decodeError(std::string_view hex)
{
    try
    {
        decodeHexByte(hex);
    }
    catch (const HexDecodeException& e)
    {
        return e.code;
    }
    FAIL("expected '" << std::string(hex) << "' to fail decoding");
    return HexDecodeError::InvalidLength;
}

TEST_SUITE_BEGIN("HexDecoder");

TEST_CASE("decodes two digit pairs")
{
    CHECK_EQ(decodeHexByte("ff"), 255);
    CHECK_EQ(decodeHexByte("00"), 0);
    CHECK_EQ(decodeHexByte("1a"), 26);
    CHECK_EQ(decodeHexByte("a1"), 161);
    CHECK_EQ(decodeHexByte("7F"), 127);
}

TEST_CASE("digits are case insensitive")
{
    CHECK_EQ(decodeHexByte("AB"), decodeHexByte("ab"));
    CHECK_EQ(decodeHexByte("aB"), 171);
}

TEST_CASE("rejects inputs that are not exactly two characters")
{
    CHECK_EQ(decodeError(""), HexDecodeError::InvalidLength);
    CHECK_EQ(decodeError("1"), HexDecodeError::InvalidLength);
    CHECK_EQ(decodeError("abc"), HexDecodeError::InvalidLength);
}

TEST_CASE("reports which digit is invalid")
{
    CHECK_EQ(decodeError("1g"), HexDecodeError::RightDigitInvalid);
    CHECK_EQ(decodeError("g1"), HexDecodeError::LeftDigitInvalid);
    CHECK_EQ(decodeError(" 1"), HexDecodeError::LeftDigitInvalid);
    CHECK_EQ(decodeError("#f"), HexDecodeError::LeftDigitInvalid);
}

TEST_CASE("left digit is checked before the right digit")
{
    CHECK_EQ(decodeError("zz"), HexDecodeError::LeftDigitInvalid);
}

TEST_CASE("hexDigitValue")
{
    CHECK_EQ(hexDigitValue('0'), 0u);
    CHECK_EQ(hexDigitValue('9'), 9u);
    CHECK_EQ(hexDigitValue('a'), 10u);
    CHECK_EQ(hexDigitValue('F'), 15u);
    CHECK_FALSE(hexDigitValue('g').has_value());
    CHECK_FALSE(hexDigitValue('G').has_value());
    CHECK_FALSE(hexDigitValue('\0').has_value());
}

TEST_CASE("exception message describes the failing input")
{
    try
    {
        decodeHexByte("1g");
        FAIL("expected decoding to fail");
    }
    catch (const HexDecodeException& e)
    {
        CHECK_EQ(std::string(e.what()), "'g' is not a hex digit");
    }
}

TEST_SUITE_END();
