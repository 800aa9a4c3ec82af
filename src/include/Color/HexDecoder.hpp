#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace wcag
{
enum class HexDecodeError
{
    InvalidLength,
    LeftDigitInvalid,
    RightDigitInvalid,
    LeftDigitOutOfRange,
    RightDigitOutOfRange,
};

std::string toString(HexDecodeError error);

class HexDecodeException : public std::exception
{
public:
    HexDecodeException(HexDecodeError code, std::string message) noexcept
        : code(code)
        , message(std::move(message))
    {
    }

    HexDecodeError code;
    std::string message;

    const char* what() const noexcept override
    {
        return message.c_str();
    }
};

/// Returns the value of a single hexadecimal digit (case-insensitive), or nullopt if it is not one
std::optional<unsigned int> hexDigitValue(char digit);

/// Decodes exactly two hexadecimal digits into a byte. The first digit is the high nibble.
/// Throws a HexDecodeException describing which digit failed
uint8_t decodeHexByte(std::string_view hex);
} // namespace wcag
