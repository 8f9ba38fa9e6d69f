// format_tools.cpp
#include "bmc_base.hpp"

#include <charconv>
#include <ctime>

namespace bmapcopy::format_tools
{

// Formatted local time with microsecond resolution, built in two steps so it does not
// depend on fmt's sub-second chrono support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(secs));
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", local);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

bool parse_u64(std::string_view text, uint64_t &out) noexcept
{
    text = trim_whitespace(text);
    if (text.empty())
    {
        return false;
    }
    uint64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc() || ptr != last)
    {
        return false;
    }
    out = value;
    return true;
}

std::string to_lower_ascii(std::string_view text)
{
    std::string out(text);
    for (auto &c : out)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // namespace bmapcopy::format_tools
