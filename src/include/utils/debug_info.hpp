/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * This header defines a set of functions and macros within the `bmapcopy::debug`
 * namespace. It leverages `fmt` for compile-time format string checks and
 * `std::source_location` for automatic source code location reporting.
 */

// -- Debugging utilities: stack trace printing, panic and debug messages
#pragma once

#include <cstdio>                 // for fflush
#include <cstdlib>                // for std::abort
#include <fmt/format.h>           // for fmt::format_string, fmt::print, fmt::format
#include <source_location>        // for std::source_location
#include <string>                 // for std::string
#include <string_view>            // for std::string_view
#include "utils/format_tools.hpp" // for bmapcopy::format_tools::filename_only

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", bmapcopy::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace bmapcopy::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * Uses `backtrace`, `dladdr` and `__cxa_demangle` to print one line per frame.
 * Errors during stack trace capture or symbol resolution are reported to `stderr`.
 *
 * @warning Not async-signal-safe; it allocates and formats.
 */
BMAPCOPY_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * This function is intended for unrecoverable programming errors (lifecycle misuse,
 * broken invariants). It formats and prints an error message to `stderr`, along with
 * the source location where `panic` was called, then calls `print_stack_trace()` and
 * `std::abort()`.
 *
 * @param loc The source location (file, line, function) where `panic` was called.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (const std::exception &e)
    {
        std::fputs("[PANIC] failed to format panic message: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("[DBG]  failed to format debug message: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace bmapcopy::debug

// ---------------- thin macros for convenience --------------

#ifndef BMC_LOC_HERE_STR
#define BMC_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Macro for calling `bmapcopy::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 * @param ... Variable arguments to be formatted into `fmt`.
 */
#ifndef BMC_PANIC
#define BMC_PANIC(fmt, ...)                                                                        \
    ::bmapcopy::debug::panic(std::source_location::current(),                                     \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Macro for calling `bmapcopy::debug::debug_msg`. Compiled out unless
 *        BMAPCOPY_ENABLE_DEBUG_MESSAGES is defined.
 */
#ifndef BMC_DEBUG
#if defined(BMAPCOPY_ENABLE_DEBUG_MESSAGES)
#define BMC_DEBUG(fmt, ...) ::bmapcopy::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define BMC_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
