#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "argparse/argparse.hpp"

#include "Cli/CliClient.hpp"
#include "Color/Color.hpp"

/// Parses a color given on the command line: either a hex color (`#RRGGBB` / `RRGGBB`) or an RGB triple `R,G,B`.
/// Throws a wcag::ColorParseException for malformed hex colors, std::invalid_argument / std::out_of_range for malformed triples
wcag::Color parseColorArgument(const std::string& argument);

/// Registers the arguments shared by every subcommand
void addSharedArguments(argparse::ArgumentParser& parser);

void addLuminanceArguments(argparse::ArgumentParser& parser);
void addContrastArguments(argparse::ArgumentParser& parser);

void applySettings(const std::string& settingsContents, CliClient& client);

/// Loads settings and applies command line overrides shared by every subcommand. Returns false if the configuration is unusable
bool configureClient(const argparse::ArgumentParser& program, CliClient& client);

int reportLuminance(const std::vector<std::string>& colors, const CliClient& client, std::ostream& output);
int reportContrast(const std::string& foreground, const std::string& background, const CliClient& client, std::ostream& output);

int startLuminance(const argparse::ArgumentParser& program);
int startContrast(const argparse::ArgumentParser& program);
