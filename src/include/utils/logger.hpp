/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: Calls from application threads (e.g. `LOGGER_INFO(...)`)
 *     format the message and push a command object into a queue.
 * 2.  **Asynchronous Worker Thread**: A single background thread is the sole consumer
 *     of the queue. It performs all sink I/O and manages sink lifetimes.
 * 3.  **Sink Abstraction**: `Sink` defines write/flush. `ConsoleSink` writes to stderr,
 *     `FileSink` appends to a file.
 * 4.  **Lifecycle**: The worker is started by the Logger lifecycle module. Log calls
 *     made before it starts are dropped; configuration calls made before it starts
 *     are a programming error and panic.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("[copy] wrote {} blocks", blocks);
 *
 * auto &logger = Logger::instance();
 * logger.set_logfile("/var/log/bmapcopy.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.flush(); // Blocks until queued messages are written
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "bmapcopy_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace bmapcopy::utils
{

class BMAPCOPY_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Returns the ModuleDef that starts and stops the logger worker.
     */
    static ModuleDef GetLifecycleModule();

    /** @brief True once the Logger lifecycle module has been started at least once. */
    static bool lifecycle_initialized() noexcept;

    // --- Sinks ---
    // Sink switches are executed in order by the worker thread; these calls block
    // until the switch has happened and return whether it succeeded.

    /** @brief Switch logging to the console (stderr). */
    bool set_console();

    /**
     * @brief Switch logging to a file, appending.
     * @param utf8_path Path to the log file.
     * @param use_flock If true, hold an advisory lock (flock) during each write.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /**
     * @brief Blocks until every message queued before this call has been written.
     */
    void flush();

    /**
     * @brief Stops the worker after draining the queue. Called by the lifecycle module.
     */
    void shutdown();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error" or "system".
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }

    struct Impl;

  private:
    Logger();

    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;

    friend void do_logger_startup(const char *);
    friend void do_logger_shutdown(const char *);
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace bmapcopy::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::bmapcopy::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::bmapcopy::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::bmapcopy::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::bmapcopy::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::bmapcopy::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

