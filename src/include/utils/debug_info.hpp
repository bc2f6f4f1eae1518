/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors, and
 *        debug messaging.
 *
 * Functions live in the `relayhub::debug` namespace. They use `fmt` for compile-time
 * format string checks and `std::source_location` for automatic source location reporting.
 */

// -- Debugging utilities: stack trace printing, panic and debug messages
#pragma once

#include <cstdio>          // for fflush
#include <cstdlib>         // for std::abort
#include <source_location> // for std::source_location
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp" // for relayhub::format_tools::filename_only

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", relayhub::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace relayhub::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * On POSIX systems it uses `backtrace`, `dladdr` and `__cxa_demangle`. On other platforms
 * it prints a notice that stack traces are unavailable. Never throws.
 */
RELAYHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors: broken internal invariants, and wiring errors when the
 * bus failure policy is `Panic`. Formats and prints the message with the source location
 * where `panic` was called, then calls `print_stack_trace()` and `std::abort()`.
 *
 * @param loc The source location where `panic` was called.
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
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str).data(), e.what());
    }
    catch (...)
    {
        std::fputs("[PANIC] FATAL UNKNOWN EXCEPTION DURING PANIC\n", stderr);
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
        fmt::print(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: '{}'\n", e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        std::fputs("[DBG]  FATAL EXCEPTION DURING DEBUG_MSG\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace relayhub::debug

// ---------------- thin macros for convenience --------------

#ifndef RLH_LOC_HERE_STR
#define RLH_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `relayhub::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 * @param ... Variable arguments to be formatted into `fmt`.
 */
#ifndef RLH_PANIC
#define RLH_PANIC(fmt, ...)                                                                        \
    ::relayhub::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Calls `relayhub::debug::debug_msg` when RELAYHUB_ENABLE_DEBUG_MESSAGES is defined;
 *        compiles to nothing otherwise.
 */
#ifndef RLH_DEBUG
#if defined(RELAYHUB_ENABLE_DEBUG_MESSAGES)
#define RLH_DEBUG(fmt, ...) ::relayhub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define RLH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
