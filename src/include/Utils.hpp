#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

void trim_start(std::string& str);
void trim_end(std::string& str);
void trim(std::string& str);
std::string toLower(std::string str);
bool isAscii(std::string_view str);
std::vector<std::string_view> split(std::string_view str, char delimiter);
std::optional<std::string> readFile(const std::string& name);

/// Formats a float as the shortest decimal that reads back to the same value (e.g. 255, 0.3239239)
std::string formatFloat(float f);
