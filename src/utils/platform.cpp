/**
 * @file platform.cpp
 * @brief Implementations for core OS-specific utilities.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `bmapcopy::platform` namespace, such as retrieving process and thread IDs,
 * getting the current executable's path, and package version information.
 */
#include "bmc_base.hpp"
#include "bmapcopy_version.h"

#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include <climits> // PATH_MAX
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(BMAPCOPY_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

namespace bmapcopy::platform
{

/**
 * @brief Gets the current process ID.
 */
uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging; uses `syscall(SYS_gettid)` on Linux and
 *          `pthread_threadid_np` on macOS.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(BMAPCOPY_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(BMAPCOPY_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @return The name or path of the executable, or "unknown" on failure.
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(BMAPCOPY_PLATFORM_LINUX)
        std::vector<char> buf;
        buf.resize(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        if (static_cast<size_t>(count) >= buf.size())
        {
            buf.resize(buf.size() * 2);
            count = readlink("/proc/self/exe", buf.data(), buf.size());
            if (count == -1)
                return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(BMAPCOPY_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                full_path = buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from bmapcopy_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return BMAPCOPY_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return BMAPCOPY_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return BMAPCOPY_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return BMAPCOPY_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace bmapcopy::platform
