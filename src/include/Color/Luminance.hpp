#pragma once

#include "Color/Color.hpp"

namespace wcag
{
/// sRGB inverse transfer function. Expects a channel normalized to [0, 1]
/// https://en.wikipedia.org/wiki/SRGB
float linearize(float channel);

/// Relative luminance of a non-normalized color, in [0, 1]
/// https://www.w3.org/TR/WCAG21/#dfn-relative-luminance
float relativeLuminance(const Color& color);

/// Contrast ratio between two colors, in [1, 21]. Independent of argument order
/// https://www.w3.org/TR/WCAG21/#dfn-contrast-ratio
float contrastRatio(const Color& a, const Color& b);

enum class ConformanceLevel
{
    AALargeText,
    AA,
    AAALargeText,
    AAA,
};

/// Minimum contrast ratio needed to satisfy a level (WCAG 2.1 SC 1.4.3 and 1.4.6)
float minimumContrastRatio(ConformanceLevel level);
bool meetsConformance(float ratio, ConformanceLevel level);

struct ContrastConformance
{
    bool aaNormalText = false;
    bool aaLargeText = false;
    bool aaaNormalText = false;
    bool aaaLargeText = false;
};

ContrastConformance evaluateConformance(float ratio);
} // namespace wcag
