#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <system_error>

// Matches the ASCII whitespace set, including vertical tab and form feed
static constexpr const char* WHITESPACE = " \t\n\v\f\r";

void trim_start(std::string& str)
{
    str.erase(0, str.find_first_not_of(WHITESPACE));
}

void trim_end(std::string& str)
{
    str.erase(str.find_last_not_of(WHITESPACE) + 1);
}

void trim(std::string& str)
{
    trim_start(str);
    trim_end(str);
}

std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c)
        {
            return std::tolower(c);
        });
    return str;
}

bool isAscii(std::string_view str)
{
    return std::all_of(str.begin(), str.end(),
        [](unsigned char c)
        {
            return c < 0x80;
        });
}

std::vector<std::string_view> split(std::string_view str, char delimiter)
{
    std::vector<std::string_view> result;

    while (true)
    {
        size_t pos = str.find(delimiter);
        result.push_back(str.substr(0, pos));
        if (pos == std::string_view::npos)
            break;
        str.remove_prefix(pos + 1);
    }

    return result;
}

std::optional<std::string> readFile(const std::string& name)
{
    // fopen succeeds on directories, and ftell then reports a bogus length
    std::error_code ec;
    if (!std::filesystem::is_regular_file(name, ec))
        return std::nullopt;

    FILE* file = fopen(name.c_str(), "rb");

    if (!file)
        return std::nullopt;

    fseek(file, 0, SEEK_END);
    long length = ftell(file);
    if (length < 0)
    {
        fclose(file);
        return std::nullopt;
    }
    fseek(file, 0, SEEK_SET);

    std::string result(length, 0);

    size_t read = fread(result.data(), 1, length, file);
    fclose(file);

    if (read != size_t(length))
        return std::nullopt;

    return result;
}

std::string formatFloat(float f)
{
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), f);
    if (ec != std::errc())
        return std::to_string(f);
    return std::string(buffer, end);
}
