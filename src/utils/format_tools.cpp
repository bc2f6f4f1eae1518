// format_tools.cpp
#include "rlh_base.hpp"

#include <cctype>

namespace relayhub::format_tools
{

// Formatted local time with microsecond resolution. fmt's chrono formatting of sub-second
// time_points differs across versions, so the fraction is appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(
                                                              std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

namespace
{
constexpr std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}
} // namespace

std::string normalize_token(std::string_view input)
{
    const auto trimmed = trim_whitespace(input);
    std::string out;
    out.reserve(trimmed.size());
    for (char c : trimmed)
    {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string quote_dot_id(std::string_view id)
{
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id)
    {
        if (c == '"' || c == '\\')
            out.push_back('\\');
        if (c == '\n')
        {
            out += "\\n";
            continue;
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string join_names(const std::vector<std::string> &names, std::string_view separator)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i != 0)
            out.append(separator);
        out.append(names[i]);
    }
    return out;
}

} // namespace relayhub::format_tools
