#pragma once

#include <ostream>

#include "Color/Color.hpp"
#include "Color/HexDecoder.hpp"

namespace wcag
{
std::ostream& operator<<(std::ostream& lhs, const Color& color);
std::ostream& operator<<(std::ostream& lhs, HexDecodeError error);
std::ostream& operator<<(std::ostream& lhs, ColorParseError error);
std::ostream& operator<<(std::ostream& lhs, ColorChannel channel);
} // namespace wcag
