/// Parses vscode-style dotted settings into ClientConfiguration

#include "Cli/CliConfigurationParser.hpp"
#include "Utils.hpp"

json parseDottedConfiguration(const std::string& contents, std::vector<std::string>* warnings)
{
    json data;

    try
    {
        data = json::parse(contents);
    }
    catch (const json::exception& err)
    {
        if (warnings)
            warnings->emplace_back(std::string("Failed to parse settings JSON: ") + err.what());
    }

    json output = json::object();

    if (!data.is_object())
        return output;

    for (const auto& el : data.items())
    {
        auto parts = split(el.key(), '.');

        if (parts.size() < 2 || parts.front() != SETTINGS_NAMESPACE)
        {
            if (warnings)
                warnings->emplace_back("Ignoring unknown setting '" + el.key() + "'");
            continue;
        }

        // Remove the namespace
        parts.erase(parts.begin());

        auto* current = &output;

        for (size_t i = 0; i < parts.size(); i++)
        {
            std::string key{parts[i]};
            if (i == parts.size() - 1)
            {
                (*current)[key] = el.value();
            }
            else
            {
                if (!current->contains(key) || !current->at(key).is_object())
                    (*current)[key] = json::object();
                current = &current->at(key);
            }
        }
    }

    return output;
}

ClientConfiguration dottedToClientConfiguration(const std::string& contents, std::vector<std::string>* warnings)
{
    return parseDottedConfiguration(contents, warnings);
}
