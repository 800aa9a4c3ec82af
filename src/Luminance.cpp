#include "Color/Luminance.hpp"

#include <algorithm>
#include <cmath>

namespace wcag
{
float linearize(float channel)
{
    if (channel <= 0.04045f)
        return channel / 12.92f;

    return std::pow((channel + 0.055f) / 1.055f, 2.4f);
}

float relativeLuminance(const Color& color)
{
    Color normalized = color.normalize();

    float red = linearize(normalized.red());
    float green = linearize(normalized.green());
    float blue = linearize(normalized.blue());

    // Luminosity coefficients of the sRGB primaries
    return 0.2126f * red + 0.7152f * green + 0.0722f * blue;
}

float contrastRatio(const Color& a, const Color& b)
{
    float luminanceA = relativeLuminance(a);
    float luminanceB = relativeLuminance(b);

    float lighter = std::max(luminanceA, luminanceB);
    float darker = std::min(luminanceA, luminanceB);

    return (lighter + 0.05f) / (darker + 0.05f);
}

float minimumContrastRatio(ConformanceLevel level)
{
    switch (level)
    {
    case ConformanceLevel::AALargeText:
        return 3.0f;
    case ConformanceLevel::AA:
    case ConformanceLevel::AAALargeText:
        return 4.5f;
    case ConformanceLevel::AAA:
        return 7.0f;
    }
    return 7.0f;
}

bool meetsConformance(float ratio, ConformanceLevel level)
{
    return ratio >= minimumContrastRatio(level);
}

ContrastConformance evaluateConformance(float ratio)
{
    ContrastConformance result;
    result.aaNormalText = meetsConformance(ratio, ConformanceLevel::AA);
    result.aaLargeText = meetsConformance(ratio, ConformanceLevel::AALargeText);
    result.aaaNormalText = meetsConformance(ratio, ConformanceLevel::AAA);
    result.aaaLargeText = meetsConformance(ratio, ConformanceLevel::AAALargeText);
    return result;
}
} // namespace wcag
