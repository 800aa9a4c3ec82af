#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "Color/HexDecoder.hpp"

namespace wcag
{
enum class ColorChannel
{
    Red,
    Green,
    Blue,
};

std::string toString(ColorChannel channel);

enum class ColorParseError
{
    EmptyInput,
    NonAsciiInput,
    InvalidLength,
    /// One of the channel digit pairs failed to decode. See `channel` and `hexError`
    InvalidChannel,
};

std::string toString(ColorParseError error);

class ColorParseException : public std::exception
{
public:
    ColorParseException(ColorParseError code, std::string message) noexcept
        : code(code)
        , message(std::move(message))
    {
    }
    ColorParseException(ColorChannel channel, const HexDecodeException& cause)
        : code(ColorParseError::InvalidChannel)
        , message("invalid " + toString(channel) + " channel: " + cause.message)
        , channel(channel)
        , hexError(cause.code)
    {
    }

    ColorParseError code;
    std::string message;
    std::optional<ColorChannel> channel = std::nullopt;
    std::optional<HexDecodeError> hexError = std::nullopt;

    const char* what() const noexcept override
    {
        return message.c_str();
    }
};

/// An sRGB color. Channels are stored as floats in [0, 255], or [0, 1] once normalized.
/// Channels can only enter through fromChannels / fromHex, so a non-normalized Color is always
/// within [0, 255].
class Color
{
public:
    static Color fromChannels(uint8_t r, uint8_t g, uint8_t b);

    /// Parses `RRGGBB` or `#RRGGBB` (case-insensitive, surrounding whitespace ignored).
    /// Throws a ColorParseException on invalid input
    static Color fromHex(std::string_view hex);

    /// Returns a copy with every channel divided by 255
    Color normalize() const;

    /// Encodes a non-normalized color as `#rrggbb`
    std::string toHex() const;

    float red() const
    {
        return r;
    }
    float green() const
    {
        return g;
    }
    float blue() const
    {
        return b;
    }

    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const;

private:
    Color(float r, float g, float b);

    float r;
    float g;
    float b;
};
} // namespace wcag
