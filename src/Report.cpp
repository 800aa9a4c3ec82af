#include "Cli/Report.hpp"

ColorReport makeColorReport(const std::string& input, const wcag::Color& color)
{
    return ColorReport{input, color.toHex(), color.red(), color.green(), color.blue(), wcag::relativeLuminance(color)};
}

ConformanceReport makeConformanceReport(const wcag::ContrastConformance& conformance)
{
    return ConformanceReport{conformance.aaNormalText, conformance.aaLargeText, conformance.aaaNormalText, conformance.aaaLargeText};
}

ContrastReport makeContrastReport(const std::string& foregroundInput, const wcag::Color& foreground, const std::string& backgroundInput,
    const wcag::Color& background, RequiredConformance required)
{
    ContrastReport report;
    report.foreground = makeColorReport(foregroundInput, foreground);
    report.background = makeColorReport(backgroundInput, background);
    report.contrastRatio = wcag::contrastRatio(foreground, background);
    report.conformance = makeConformanceReport(wcag::evaluateConformance(report.contrastRatio));
    report.required = required;

    if (auto level = toConformanceLevel(required))
        report.meetsRequired = wcag::meetsConformance(report.contrastRatio, *level);

    return report;
}
