#pragma once
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "Cli/ClientConfiguration.hpp"
#include "Color/Color.hpp"
#include "Color/Luminance.hpp"

struct ColorReport
{
    /// The argument exactly as the user wrote it
    std::string input;
    std::string hex;
    float red = 0.0f;
    float green = 0.0f;
    float blue = 0.0f;
    float luminance = 0.0f;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ColorReport, input, hex, red, green, blue, luminance)

struct ConformanceReport
{
    bool aaNormalText = false;
    bool aaLargeText = false;
    bool aaaNormalText = false;
    bool aaaLargeText = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConformanceReport, aaNormalText, aaLargeText, aaaNormalText, aaaLargeText)

struct LuminanceReport
{
    std::vector<ColorReport> colors{};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LuminanceReport, colors)

struct ContrastReport
{
    ColorReport foreground;
    ColorReport background;
    float contrastRatio = 1.0f;
    ConformanceReport conformance;
    RequiredConformance required = RequiredConformance::None;
    bool meetsRequired = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ContrastReport, foreground, background, contrastRatio, conformance, required, meetsRequired)

ColorReport makeColorReport(const std::string& input, const wcag::Color& color);
ConformanceReport makeConformanceReport(const wcag::ContrastConformance& conformance);
ContrastReport makeContrastReport(const std::string& foregroundInput, const wcag::Color& foreground, const std::string& backgroundInput,
    const wcag::Color& background, RequiredConformance required = RequiredConformance::None);
