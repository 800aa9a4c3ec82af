#pragma once
#include <optional>
#include "nlohmann/json.hpp"

#include "Color/Luminance.hpp"

enum struct OutputFormat
{
    Default,
    Json,
};
NLOHMANN_JSON_SERIALIZE_ENUM(OutputFormat, {
                                               {OutputFormat::Default, "default"},
                                               {OutputFormat::Json, "json"},
                                           })

enum struct LogLevel
{
    Error = 1,
    Warning = 2,
    Info = 3,
    Log = 4,
};
NLOHMANN_JSON_SERIALIZE_ENUM(LogLevel, {
                                           {LogLevel::Warning, "warning"},
                                           {LogLevel::Error, "error"},
                                           {LogLevel::Info, "info"},
                                           {LogLevel::Log, "log"},
                                       })

enum struct RequiredConformance
{
    None,
    AALargeText,
    AA,
    AAALargeText,
    AAA,
};
NLOHMANN_JSON_SERIALIZE_ENUM(RequiredConformance, {
                                                      {RequiredConformance::None, "none"},
                                                      {RequiredConformance::AALargeText, "AA-large"},
                                                      {RequiredConformance::AA, "AA"},
                                                      {RequiredConformance::AAALargeText, "AAA-large"},
                                                      {RequiredConformance::AAA, "AAA"},
                                                  })

inline std::optional<wcag::ConformanceLevel> toConformanceLevel(RequiredConformance required)
{
    switch (required)
    {
    case RequiredConformance::None:
        return std::nullopt;
    case RequiredConformance::AALargeText:
        return wcag::ConformanceLevel::AALargeText;
    case RequiredConformance::AA:
        return wcag::ConformanceLevel::AA;
    case RequiredConformance::AAALargeText:
        return wcag::ConformanceLevel::AAALargeText;
    case RequiredConformance::AAA:
        return wcag::ConformanceLevel::AAA;
    }
    return std::nullopt;
}

struct ClientOutputConfiguration
{
    /// How results are written to stdout
    OutputFormat format = OutputFormat::Default;
    /// Whether the parsed channels of every color are echoed alongside the result
    bool showColors = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientOutputConfiguration, format, showColors);

struct ClientConformanceConfiguration
{
    /// The level a color pair must meet for `contrast` to exit successfully
    RequiredConformance require = RequiredConformance::None;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientConformanceConfiguration, require);

struct ClientConfiguration
{
    ClientOutputConfiguration output{};
    ClientConformanceConfiguration conformance{};
    LogLevel logLevel = LogLevel::Warning;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientConfiguration, output, conformance, logLevel);
