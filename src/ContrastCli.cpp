#include "Cli/ContrastCli.hpp"
#include "Cli/CliConfigurationParser.hpp"
#include "Cli/Report.hpp"
#include "Color/IostreamHelpers.hpp"
#include "Color/Luminance.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

static uint8_t parseChannel(std::string_view part, const std::string& argument)
{
    std::string value{part};
    trim(value);

    if (value.empty() || value.size() > 3 ||
        !std::all_of(value.begin(), value.end(),
            [](unsigned char c)
            {
                return std::isdigit(c);
            }))
        throw std::invalid_argument("invalid channel value '" + value + "' in RGB triple '" + argument + "'");

    int channel = std::stoi(value);
    if (channel > 255)
        throw std::out_of_range("channel value " + value + " in RGB triple '" + argument + "' is larger than 255");

    return static_cast<uint8_t>(channel);
}

wcag::Color parseColorArgument(const std::string& argument)
{
    if (argument.find(',') == std::string::npos)
        return wcag::Color::fromHex(argument);

    auto parts = split(argument, ',');
    if (parts.size() != 3)
        throw std::invalid_argument("expected an RGB triple R,G,B, got '" + argument + "'");

    return wcag::Color::fromChannels(parseChannel(parts[0], argument), parseChannel(parts[1], argument), parseChannel(parts[2], argument));
}

void addSharedArguments(argparse::ArgumentParser& parser)
{
    parser.add_argument("--settings").help("path to a settings JSON file using dotted `wcag-contrast.*` keys").metavar("PATH");
    parser.add_argument("--format").help("output results in a particular format").choices("default", "json");
    parser.add_argument("--show-colors").help("echo the parsed channels of every color").default_value(false).implicit_value(true);
    parser.add_argument("--verbose").help("log every step to stderr").default_value(false).implicit_value(true);
}

void addLuminanceArguments(argparse::ArgumentParser& parser)
{
    parser.add_argument("colors").help("colors to compute the luminance of").nargs(argparse::nargs_pattern::at_least_one);
}

void addContrastArguments(argparse::ArgumentParser& parser)
{
    parser.add_argument("--require")
        .help("exit with a failure status if the colors do not meet a conformance level")
        .choices("AA", "AA-large", "AAA", "AAA-large");
    parser.add_argument("foreground").help("foreground (text) color");
    parser.add_argument("background").help("background color");
}

void applySettings(const std::string& settingsContents, CliClient& client)
{
    std::vector<std::string> warnings;
    client.configuration = dottedToClientConfiguration(settingsContents, &warnings);

    // Sent once the configured log level is known
    for (const auto& warning : warnings)
        client.sendLogMessage(LogLevel::Warning, warning);
}

bool configureClient(const argparse::ArgumentParser& program, CliClient& client)
{
    if (auto settingsPath = program.present<std::string>("--settings"))
    {
        try
        {
            std::optional<std::string> contents = readFile(*settingsPath);
            if (!contents)
            {
                client.sendLogMessage(LogLevel::Error, "Failed to read settings at '" + *settingsPath + "'");
                return false;
            }

            applySettings(*contents, client);
        }
        catch (const std::exception& err)
        {
            client.sendLogMessage(LogLevel::Error, "Invalid settings in '" + *settingsPath + "': " + err.what());
            return false;
        }
    }

    if (auto format = program.present<std::string>("--format"))
        client.configuration.output.format = json(*format).get<OutputFormat>();
    if (program.get<bool>("--show-colors"))
        client.configuration.output.showColors = true;
    if (program.get<bool>("--verbose"))
        client.configuration.logLevel = LogLevel::Log;

    client.sendLogMessage(LogLevel::Log, "using configuration " + json(client.configuration).dump());
    return true;
}

static std::string passFail(bool passed)
{
    return passed ? "pass" : "fail";
}

int reportLuminance(const std::vector<std::string>& colors, const CliClient& client, std::ostream& output)
{
    const auto& outputConfiguration = client.configuration.output;

    LuminanceReport report;
    bool failed = false;

    for (const auto& input : colors)
    {
        try
        {
            auto color = parseColorArgument(input);
            client.sendLogMessage(LogLevel::Info, input + " parsed as " + color.toHex());
            report.colors.emplace_back(makeColorReport(input, color));

            if (outputConfiguration.format == OutputFormat::Default)
            {
                if (outputConfiguration.showColors)
                    output << input << " from input: " << color << '\n';
                output << "luminance of " << input << " is " << formatFloat(report.colors.back().luminance) << '\n';
            }
        }
        catch (const std::exception& err)
        {
            client.sendLogMessage(LogLevel::Error, "Invalid color '" + input + "': " + err.what());
            failed = true;
        }
    }

    if (outputConfiguration.format == OutputFormat::Json)
        output << json(report).dump(4) << '\n';

    return failed ? 1 : 0;
}

int reportContrast(const std::string& foreground, const std::string& background, const CliClient& client, std::ostream& output)
{
    const auto& outputConfiguration = client.configuration.output;

    std::optional<wcag::Color> foregroundColor;
    std::optional<wcag::Color> backgroundColor;
    try
    {
        foregroundColor = parseColorArgument(foreground);
        backgroundColor = parseColorArgument(background);
    }
    catch (const std::exception& err)
    {
        client.sendLogMessage(LogLevel::Error, std::string("Invalid color: ") + err.what());
        return 1;
    }

    auto report = makeContrastReport(foreground, *foregroundColor, background, *backgroundColor, client.configuration.conformance.require);
    client.sendLogMessage(LogLevel::Info, "luminance of " + foreground + " is " + formatFloat(report.foreground.luminance) + ", luminance of " +
                                              background + " is " + formatFloat(report.background.luminance));

    if (outputConfiguration.format == OutputFormat::Json)
    {
        output << json(report).dump(4) << '\n';
    }
    else
    {
        if (outputConfiguration.showColors)
        {
            output << foreground << " from input: " << *foregroundColor << '\n';
            output << background << " from input: " << *backgroundColor << '\n';
        }
        output << "contrast ratio of " << foreground << " and " << background << " is " << formatFloat(report.contrastRatio) << ":1\n";
        output << "  AA normal text:  " << passFail(report.conformance.aaNormalText) << '\n';
        output << "  AA large text:   " << passFail(report.conformance.aaLargeText) << '\n';
        output << "  AAA normal text: " << passFail(report.conformance.aaaNormalText) << '\n';
        output << "  AAA large text:  " << passFail(report.conformance.aaaLargeText) << '\n';
        if (report.required != RequiredConformance::None)
            output << "required " << json(report.required).get<std::string>() << ": " << passFail(report.meetsRequired) << '\n';
    }

    if (!report.meetsRequired)
    {
        client.sendLogMessage(LogLevel::Warning,
            "contrast ratio " + formatFloat(report.contrastRatio) + " does not meet " + json(report.required).get<std::string>());
        return 1;
    }

    return 0;
}

int startLuminance(const argparse::ArgumentParser& program)
{
    CliClient client;
    if (!configureClient(program, client))
        return 1;

    return reportLuminance(program.get<std::vector<std::string>>("colors"), client, std::cout);
}

int startContrast(const argparse::ArgumentParser& program)
{
    CliClient client;
    if (!configureClient(program, client))
        return 1;

    if (auto required = program.present<std::string>("--require"))
        client.configuration.conformance.require = json(*required).get<RequiredConformance>();

    return reportContrast(program.get<std::string>("foreground"), program.get<std::string>("background"), client, std::cout);
}
