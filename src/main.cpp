#include "Cli/ContrastCli.hpp"
#include "argparse/argparse.hpp"

#include <iostream>

#ifndef WCAG_CONTRAST_VERSION
#define WCAG_CONTRAST_VERSION "0.0.0-dev"
#endif

int main(int argc, char** argv)
{
    argparse::ArgumentParser program("wcag-contrast", WCAG_CONTRAST_VERSION);

    // Global arguments
    argparse::ArgumentParser parent_parser("-", "0.0", argparse::default_arguments::none);
    addSharedArguments(parent_parser);

    // Luminance arguments
    argparse::ArgumentParser luminance_command("luminance");
    luminance_command.set_assign_chars(":=");
    luminance_command.add_description("Compute the relative luminance of colors");
    luminance_command.add_epilog("A color is either a hex color (#RRGGBB or RRGGBB) or an RGB triple (R,G,B)");
    luminance_command.add_parents(parent_parser);
    addLuminanceArguments(luminance_command);

    // Contrast arguments
    argparse::ArgumentParser contrast_command("contrast");
    contrast_command.set_assign_chars(":=");
    contrast_command.add_description("Compute the WCAG 2.1 contrast ratio between two colors");
    contrast_command.add_epilog("A color is either a hex color (#RRGGBB or RRGGBB) or an RGB triple (R,G,B)");
    contrast_command.add_parents(parent_parser);
    addContrastArguments(contrast_command);

    program.add_subparser(luminance_command);
    program.add_subparser(contrast_command);

    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    try
    {
        if (program.is_subcommand_used("luminance"))
        {
            return startLuminance(luminance_command);
        }
        else if (program.is_subcommand_used("contrast"))
        {
            return startContrast(contrast_command);
        }
    }
    catch (const std::exception& err)
    {
        std::cerr << "[ERROR] " << err.what() << '\n';
        return 1;
    }

    // No sub-command specified
    std::cerr << "Specify a particular mode to run the program (luminance/contrast)" << '\n';
    std::cerr << program;
    return 1;
}
