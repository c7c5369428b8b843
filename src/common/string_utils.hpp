#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace worklog {

inline std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline bool containsCaseInsensitive(const std::string &haystack, const std::string &needle)
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

inline bool startsWithCaseInsensitive(const std::string &value, const std::string &prefix)
{
    return toLower(value).rfind(toLower(prefix), 0) == 0;
}

// strcasecmp-style ordering for name sorts.
inline bool lessCaseInsensitive(const std::string &a, const std::string &b)
{
    return toLower(a) < toLower(b);
}

inline std::string join(const std::vector<std::string> &parts, const std::string &separator)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace worklog
