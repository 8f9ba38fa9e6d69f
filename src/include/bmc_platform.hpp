#pragma once
/**
 * @file bmc_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (BMAPCOPY_PLATFORM_LINUX, BMAPCOPY_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)

#define BMAPCOPY_PLATFORM_APPLE 1
#undef BMAPCOPY_PLATFORM_LINUX
#undef BMAPCOPY_PLATFORM_FREEBSD

#elif defined(PLATFORM_FREEBSD)

#define BMAPCOPY_PLATFORM_FREEBSD 1
#undef BMAPCOPY_PLATFORM_APPLE
#undef BMAPCOPY_PLATFORM_LINUX

#elif defined(PLATFORM_LINUX)

#define BMAPCOPY_PLATFORM_LINUX 1
#undef BMAPCOPY_PLATFORM_APPLE
#undef BMAPCOPY_PLATFORM_FREEBSD

#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define BMAPCOPY_PLATFORM_APPLE 1
#undef BMAPCOPY_PLATFORM_LINUX
#undef BMAPCOPY_PLATFORM_FREEBSD

#elif defined(__FreeBSD__)
#define BMAPCOPY_PLATFORM_FREEBSD 1
#undef BMAPCOPY_PLATFORM_APPLE
#undef BMAPCOPY_PLATFORM_LINUX

#elif defined(__linux__)
#define BMAPCOPY_PLATFORM_LINUX 1
#undef BMAPCOPY_PLATFORM_APPLE
#undef BMAPCOPY_PLATFORM_FREEBSD

#else
#define BMAPCOPY_PLATFORM_UNKNOWN 1
#undef BMAPCOPY_PLATFORM_FREEBSD
#undef BMAPCOPY_PLATFORM_APPLE
#undef BMAPCOPY_PLATFORM_LINUX
#endif
#endif

// Convenience booleans for source code usage:
#if defined(BMAPCOPY_PLATFORM_APPLE) || defined(BMAPCOPY_PLATFORM_FREEBSD) ||                      \
    defined(BMAPCOPY_PLATFORM_LINUX)
#define BMAPCOPY_IS_POSIX 1
#else
#undef BMAPCOPY_IS_POSIX
#endif

// Block devices, sysfs tuning and positioned I/O are POSIX-only.
#if !defined(BMAPCOPY_IS_POSIX)
#error "bmapcopy requires a POSIX platform."
#endif

// --- Require C++20 or later --------------------------------------------------
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "bmapcopy_utils_export.h"

namespace bmapcopy::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
BMAPCOPY_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
BMAPCOPY_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
BMAPCOPY_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets the major version number of the bmapcopy package.
 * @return The major version (e.g., 1 from 1.2.7).
 */
BMAPCOPY_UTILS_EXPORT int get_version_major() noexcept;
/**
 * @brief Gets the minor version number of the bmapcopy package.
 * @return The minor version (e.g., 2 from 1.2.7).
 */
BMAPCOPY_UTILS_EXPORT int get_version_minor() noexcept;
/**
 * @brief Gets the rolling version number (e.g., from git commit count).
 * @return The rolling version (e.g., 7 from 1.2.7).
 */
BMAPCOPY_UTILS_EXPORT int get_version_rolling() noexcept;
/**
 * @brief Gets the full version string (major.minor.rolling).
 * @return A string such as "1.2.7".
 */
BMAPCOPY_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @details Uses std::chrono::steady_clock. Suitable for measuring elapsed time and
 *          throttling periodic work such as progress updates.
 * @return Monotonic timestamp in nanoseconds since an unspecified epoch.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
BMAPCOPY_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns.
 * @note If start_ns is in the future (clock skew), returns 0.
 */
BMAPCOPY_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace bmapcopy::platform
