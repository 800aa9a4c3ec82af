#include "Color/Color.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace wcag
{
std::string toString(ColorChannel channel)
{
    switch (channel)
    {
    case ColorChannel::Red:
        return "red";
    case ColorChannel::Green:
        return "green";
    case ColorChannel::Blue:
        return "blue";
    }
    return "unknown";
}

std::string toString(ColorParseError error)
{
    switch (error)
    {
    case ColorParseError::EmptyInput:
        return "EmptyInput";
    case ColorParseError::NonAsciiInput:
        return "NonAsciiInput";
    case ColorParseError::InvalidLength:
        return "InvalidLength";
    case ColorParseError::InvalidChannel:
        return "InvalidChannel";
    }
    return "Unknown";
}

Color::Color(float r, float g, float b)
    : r(r)
    , g(g)
    , b(b)
{
}

Color Color::fromChannels(uint8_t r, uint8_t g, uint8_t b)
{
    return Color{static_cast<float>(r), static_cast<float>(g), static_cast<float>(b)};
}

static uint8_t decodeChannel(ColorChannel channel, std::string_view hex)
{
    try
    {
        return decodeHexByte(hex);
    }
    catch (const HexDecodeException& e)
    {
        throw ColorParseException(channel, e);
    }
}

Color Color::fromHex(std::string_view hex)
{
    if (hex.empty())
        throw ColorParseException(ColorParseError::EmptyInput, "color input is empty");

    // Must happen before case folding, so multi-byte lookalikes are never folded into digits
    if (!isAscii(hex))
        throw ColorParseException(ColorParseError::NonAsciiInput, "color input contains non-ASCII characters");

    std::string input = toLower(std::string(hex));
    trim(input);

    // Only allow input like RRGGBB or #RRGGBB
    bool hasHash = !input.empty() && input[0] == '#';
    if (input.size() != (hasHash ? 7 : 6))
        throw ColorParseException(
            ColorParseError::InvalidLength, "expected RRGGBB or #RRGGBB, got " + std::to_string(input.size()) + " characters");

    std::string_view digits = input;
    if (hasHash)
        digits.remove_prefix(1);

    auto red = decodeChannel(ColorChannel::Red, digits.substr(0, 2));
    auto green = decodeChannel(ColorChannel::Green, digits.substr(2, 2));
    auto blue = decodeChannel(ColorChannel::Blue, digits.substr(4, 2));

    return fromChannels(red, green, blue);
}

Color Color::normalize() const
{
    return Color{r / 255.0f, g / 255.0f, b / 255.0f};
}

static int toByte(float channel)
{
    return static_cast<int>(std::lround(std::clamp(channel, 0.0f, 255.0f)));
}

std::string Color::toHex() const
{
    std::stringstream hexString;
    hexString << "#";
    hexString << std::setfill('0') << std::setw(6) << std::hex << (toByte(r) << 16 | toByte(g) << 8 | toByte(b));
    return hexString.str();
}

bool Color::operator==(const Color& other) const
{
    return r == other.r && g == other.g && b == other.b;
}

bool Color::operator!=(const Color& other) const
{
    return !(*this == other);
}
} // namespace wcag
