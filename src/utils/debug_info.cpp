/**
 * @file debug_info.cpp
 * @brief POSIX stack trace printing for bmapcopy::debug::print_stack_trace()
 */

#include "bmc_base.hpp"

#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#include <new>
#include <string>

namespace bmapcopy::debug
{

namespace // anonymous namespace
{
// Format into a fixed stack buffer; output is truncated rather than allocated.
template <typename... Args>
inline bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];

        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);

        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;

        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const fmt::format_error &)
    {
        return false;
    }
}

} // namespace

void print_stack_trace() noexcept
{
    try
    {
        constexpr int kMaxFrames = 200;
        void *callstack[kMaxFrames];
        int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        char **symbols = backtrace_symbols(callstack, nframes);

        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            bool printed = false;
            if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
            {
                int status = 0;
                char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
                std::string name = (status == 0 && dem) ? std::string(dem) : dlinfo.dli_sname;
                std::free(dem);
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                if (saddr)
                    safe_format_to_stderr("{} + {:#x}", name,
                                          static_cast<unsigned long long>(addr - saddr));
                else
                    safe_format_to_stderr("{}", name);
                printed = true;
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
                printed = true;
            }

            if (!printed)
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::free(symbols);
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace bmapcopy::debug
