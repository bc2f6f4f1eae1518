// Tools for formatting string
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "rlh_platform.hpp"

namespace relayhub::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
RELAYHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Returns a lower-cased copy of an ASCII string with surrounding whitespace removed.
 * @details Used to normalise enumerated configuration values ("Per_Instance " -> "per_instance").
 */
RELAYHUB_UTILS_EXPORT std::string normalize_token(std::string_view input);

/**
 * @brief Quotes and escapes an identifier for Graphviz DOT output.
 * @details Wraps in double quotes and escapes embedded quotes and backslashes.
 */
RELAYHUB_UTILS_EXPORT std::string quote_dot_id(std::string_view id);

/**
 * @brief Joins handler or channel names with a separator ("a,b,c").
 */
RELAYHUB_UTILS_EXPORT std::string join_names(const std::vector<std::string> &names,
                                             std::string_view separator = ",");

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 * @tparam Args Argument types for the format string.
 * @param fmt_str The `fmt`-style format string.
 * @param args The arguments to format.
 * @return A `fmt::memory_buffer` containing the formatted result.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace relayhub::format_tools
