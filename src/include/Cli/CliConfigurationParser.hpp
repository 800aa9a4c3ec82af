#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "Cli/ClientConfiguration.hpp"

using json = nlohmann::json;

/// Settings keys are namespaced under this prefix, e.g. `wcag-contrast.output.format`
inline constexpr const char* SETTINGS_NAMESPACE = "wcag-contrast";

/// Problems that do not prevent parsing (malformed JSON, unknown keys) are appended to `warnings` when given
json parseDottedConfiguration(const std::string& contents, std::vector<std::string>* warnings = nullptr);
ClientConfiguration dottedToClientConfiguration(const std::string& contents, std::vector<std::string>* warnings = nullptr);
