// Tools for formatting string
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <fmt/format.h>

#include "bmapcopy_utils_export.h"

namespace bmapcopy::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
BMAPCOPY_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Trims ASCII whitespace from both ends of a string_view.
 * @param str The view to trim.
 * @return A sub-view of `str` without leading and trailing whitespace.
 */
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

/**
 * @brief Parses an unsigned decimal integer, rejecting signs, garbage and overflow.
 * @param text The text to parse. Surrounding whitespace is ignored.
 * @param out  Receives the value on success; untouched on failure.
 * @return `true` if the whole (trimmed) text was a valid unsigned integer.
 */
BMAPCOPY_UTILS_EXPORT bool parse_u64(std::string_view text, uint64_t &out) noexcept;

/**
 * @brief Lower-cases ASCII letters of a string.
 */
BMAPCOPY_UTILS_EXPORT std::string to_lower_ascii(std::string_view text);

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
    mb.reserve(128); // small reserve to avoid many reallocs
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
    if (last_slash == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_slash + 1);
}

} // namespace bmapcopy::format_tools
