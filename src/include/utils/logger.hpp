/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe, synchronous logging utility.
 *
 * **Design**
 * 1.  **Synchronous writes**: bus dispatch is synchronous and single-threaded, so a
 *     log call formats the record and writes it to the active sink before returning.
 *     Records are therefore ordered exactly like the handler calls that produced them.
 * 2.  **Sink Abstraction**: A `Sink` base class defines a simple interface for
 *     writing and flushing. Concrete implementations (`ConsoleSink`, `FileSink`)
 *     encapsulate the details of each destination; `set_sink` installs any other.
 * 3.  **Robustness**: I/O errors never propagate to the caller. They are reported via
 *     the write-error callback (or stderr when none is installed).
 *
 * **Thread Safety**
 * - All public methods are thread-safe; sink access is serialized by one mutex.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("channel '{}' declared", name);
 *
 * Logger& logger = Logger::instance();
 * logger.set_logfile("/var/log/relayhub.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "rlh_platform.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace relayhub::utils
{

class Sink;
struct LoggerImpl;

class RELAYHUB_UTILS_EXPORT Logger
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

    // --- Sinks / Configuration ---

    /**
     * @brief Switch logging to the console (stderr). This is the initial sink.
     */
    void set_console();

    /**
     * @brief Switch logging to an append-mode file.
     * @param path File to append to; created if missing.
     * @param use_flock Hold an advisory lock around every write (POSIX).
     * @return false if the file could not be opened. The previous sink stays active and
     *         the failure is reported through the write-error callback.
     */
    bool set_logfile(const std::string &path, bool use_flock = false);

    /**
     * @brief Install a custom sink (e.g. an in-memory capture in tests).
     *        A null sink silences output.
     */
    void set_sink(std::unique_ptr<Sink> sink);

    /** @brief Description of the active sink ("Console", "File: ...", ...). */
    [[nodiscard]] std::string sink_description() const;

    /**
     * @brief Flush the active sink and switch back to the console sink.
     */
    void shutdown();

    void flush();

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Sets a callback invoked with a description when a sink write fails.
     *        Passing an empty function restores the default (print to stderr).
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

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
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // Runtime format strings
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    // Writes one formatted record to the active sink.
    void write_log(Level lvl, std::string &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

/**
 * @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system"
 *        (case-insensitive). Returns std::nullopt for anything else.
 */
RELAYHUB_UTILS_EXPORT std::optional<Logger::Level> parse_level(std::string_view text);

/** @brief Lower-case name of a level, the inverse of parse_level. */
RELAYHUB_UTILS_EXPORT const char *level_to_string(Logger::Level lvl) noexcept;

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
            write_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            write_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        write_log(lvl, std::string(mb.data(), mb.size()));
    }
    catch (const std::exception &ex)
    {
        write_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

} // namespace relayhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::relayhub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::relayhub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::relayhub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::relayhub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::relayhub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::relayhub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::relayhub::utils::Logger::instance().log_fmt_runtime(                                         \
        ::relayhub::utils::Logger::Level::L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::relayhub::utils::Logger::instance().log_fmt_runtime(                                         \
        ::relayhub::utils::Logger::Level::L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
