#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "Cli/ClientConfiguration.hpp"

static std::string getLogLevelString(const LogLevel& type)
{
    switch (type)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Log:
        return "LOG";
    }
    return "LOG";
}

struct CliClient
{
    ClientConfiguration configuration;
    /// Every error reported through sendLogMessage, regardless of the configured log level
    mutable std::vector<std::string> errors{};

    void sendLogMessage(const LogLevel& type, const std::string& message) const
    {
        if (type == LogLevel::Error)
            errors.emplace_back(message);

        if (static_cast<int>(type) <= static_cast<int>(configuration.logLevel))
            std::cerr << "[" << getLogLevelString(type) << "] " << message << '\n';
    }
};
