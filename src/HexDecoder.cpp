#include "Color/HexDecoder.hpp"

namespace wcag
{
std::string toString(HexDecodeError error)
{
    switch (error)
    {
    case HexDecodeError::InvalidLength:
        return "InvalidLength";
    case HexDecodeError::LeftDigitInvalid:
        return "LeftDigitInvalid";
    case HexDecodeError::RightDigitInvalid:
        return "RightDigitInvalid";
    case HexDecodeError::LeftDigitOutOfRange:
        return "LeftDigitOutOfRange";
    case HexDecodeError::RightDigitOutOfRange:
        return "RightDigitOutOfRange";
    }
    return "Unknown";
}

std::optional<unsigned int> hexDigitValue(char digit)
{
    if (digit >= '0' && digit <= '9')
        return digit - '0';
    if (digit >= 'a' && digit <= 'f')
        return digit - 'a' + 10;
    if (digit >= 'A' && digit <= 'F')
        return digit - 'A' + 10;
    return std::nullopt;
}

uint8_t decodeHexByte(std::string_view hex)
{
    if (hex.size() != 2)
        throw HexDecodeException(
            HexDecodeError::InvalidLength, "expected 2 hex digits, got " + std::to_string(hex.size()) + " characters");

    auto left = hexDigitValue(hex[0]);
    if (!left)
        throw HexDecodeException(HexDecodeError::LeftDigitInvalid, "'" + std::string(1, hex[0]) + "' is not a hex digit");

    auto right = hexDigitValue(hex[1]);
    if (!right)
        throw HexDecodeException(HexDecodeError::RightDigitInvalid, "'" + std::string(1, hex[1]) + "' is not a hex digit");

    // Unreachable while hexDigitValue only accepts [0-9a-fA-F], but must never be clamped
    if (*left > 15)
        throw HexDecodeException(HexDecodeError::LeftDigitOutOfRange, "left digit value " + std::to_string(*left) + " does not fit in a nibble");

    if (*right > 15)
        throw HexDecodeException(HexDecodeError::RightDigitOutOfRange, "right digit value " + std::to_string(*right) + " does not fit in a nibble");

    return static_cast<uint8_t>(*left * 16 + *right);
}
} // namespace wcag
