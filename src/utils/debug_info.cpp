/**
 * @file debug_info.cpp
 * @brief Stack trace printing for relayhub::debug::print_stack_trace()
 *
 * Macro assumptions:
 * - RELAYHUB_IS_POSIX : defined for POSIX-like platforms (Linux, macOS, FreeBSD)
 *
 * Other platforms print a notice instead of a trace.
 */

#include "rlh_base.hpp"

#if defined(RELAYHUB_IS_POSIX)
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#include <string>
#endif

namespace relayhub::debug
{

namespace
{
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("  [stack trace line could not be formatted]\n", stderr);
    }
}

#if defined(RELAYHUB_IS_POSIX)
std::string demangle(const char *symbol)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return symbol;
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    try
    {
        safe_format_to_stderr("Stack Trace (most recent call first):\n");

#if defined(RELAYHUB_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        // Frame 0 is this function itself.
        for (int i = 1; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) != 0)
            {
                const std::string symbol =
                    dlinfo.dli_sname != nullptr ? demangle(dlinfo.dli_sname) : std::string("??");
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                safe_format_to_stderr(
                    "  #{:02} {} [{}+{:#x}]\n", i, symbol,
                    format_tools::filename_only(dlinfo.dli_fname != nullptr ? dlinfo.dli_fname
                                                                             : "??"),
                    addr - base);
            }
            else
            {
                safe_format_to_stderr("  #{:02} ?? [{:#x}]\n", i, addr);
            }
        }
#else
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
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

} // namespace relayhub::debug
