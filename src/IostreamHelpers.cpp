#include "Color/IostreamHelpers.hpp"
#include "Utils.hpp"

namespace wcag
{
std::ostream& operator<<(std::ostream& stream, const Color& color)
{
    return stream << "(r: " << formatFloat(color.red()) << ", g: " << formatFloat(color.green()) << ", b: " << formatFloat(color.blue())
                  << ")";
}

std::ostream& operator<<(std::ostream& stream, HexDecodeError error)
{
    return stream << toString(error);
}

std::ostream& operator<<(std::ostream& stream, ColorParseError error)
{
    return stream << toString(error);
}

std::ostream& operator<<(std::ostream& stream, ColorChannel channel)
{
    return stream << toString(channel);
}
} // namespace wcag
