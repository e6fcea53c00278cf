#pragma once
#include <algorithm>
#include <cctype>
#include <istream>
#include <optional>
#include <string>

inline std::string trim(const std::string &s)
{
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return b < e ? std::string(b, e) : std::string();
}

inline std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// Reads one line, trimmed and lower-cased. A blank line gives `fallback`.
// nullopt only when the stream is exhausted.
inline std::optional<std::string> read_input(std::istream &in, const std::string &fallback = "")
{
    std::string line;
    if (!std::getline(in, line))
        return std::nullopt;
    line = trim(line);
    if (line.empty())
        return fallback;
    return to_lower(line);
}
