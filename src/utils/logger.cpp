// logger.cpp
#include "rlh_service.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

namespace relayhub::utils
{

// Implementation details hidden behind the pImpl pointer.
struct LoggerImpl
{
    std::mutex mtx;
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::atomic<int> level{static_cast<int>(Logger::Level::L_INFO)};
    std::function<void(const std::string &)> error_callback;
};

namespace
{
// Reports a sink failure without holding the logger mutex, so the callback may log.
void report_write_error(const std::function<void(const std::string &)> &cb,
                        const std::string &what) noexcept
{
    try
    {
        if (cb)
        {
            cb(what);
            return;
        }
        fmt::print(stderr, "[RLH] logger error: {}\n", what);
    }
    catch (const std::exception &e)
    {
        std::fputs("[RLH] logger error callback failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
}
} // namespace

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger inst;
    return inst;
}

void Logger::set_console()
{
    set_sink(std::make_unique<ConsoleSink>());
}

bool Logger::set_logfile(const std::string &path, bool use_flock)
{
    std::unique_ptr<Sink> file_sink;
    try
    {
        file_sink = std::make_unique<FileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        std::function<void(const std::string &)> cb;
        {
            std::lock_guard<std::mutex> g(pImpl->mtx);
            cb = pImpl->error_callback;
        }
        report_write_error(cb, e.what());
        return false;
    }
    set_sink(std::move(file_sink));
    return true;
}

void Logger::set_sink(std::unique_ptr<Sink> sink)
{
    std::unique_ptr<Sink> previous;
    std::function<void(const std::string &)> cb;
    {
        std::lock_guard<std::mutex> g(pImpl->mtx);
        cb = pImpl->error_callback;
        previous = std::move(pImpl->sink);
        pImpl->sink = std::move(sink);
    }
    if (previous)
    {
        try
        {
            previous->flush();
        }
        catch (const std::exception &e)
        {
            report_write_error(cb, e.what());
        }
    }
}

std::string Logger::sink_description() const
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    return pImpl->sink ? pImpl->sink->description() : std::string("None");
}

void Logger::shutdown()
{
    flush();
    set_console();
}

void Logger::flush()
{
    std::string failure;
    std::function<void(const std::string &)> cb;
    {
        std::lock_guard<std::mutex> g(pImpl->mtx);
        if (!pImpl->sink)
            return;
        try
        {
            pImpl->sink->flush();
        }
        catch (const std::exception &e)
        {
            failure = e.what();
            cb = pImpl->error_callback;
        }
    }
    if (!failure.empty())
        report_write_error(cb, failure);
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    pImpl->error_callback = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::write_log(Level lvl, std::string &&body) noexcept
{
    std::string failure;
    std::function<void(const std::string &)> cb;
    try
    {
        LogMessage msg{std::chrono::system_clock::now(), platform::get_pid(),
                       platform::get_native_thread_id(), static_cast<int>(lvl), std::move(body)};
        std::lock_guard<std::mutex> g(pImpl->mtx);
        if (!pImpl->sink)
            return;
        try
        {
            pImpl->sink->write(msg);
        }
        catch (const std::exception &e)
        {
            failure = fmt::format("write to '{}' failed: {}", pImpl->sink->description(), e.what());
            cb = pImpl->error_callback;
        }
    }
    catch (const std::exception &e)
    {
        failure = e.what();
    }
    if (!failure.empty())
        report_write_error(cb, failure);
}

std::optional<Logger::Level> parse_level(std::string_view text)
{
    const auto token = format_tools::normalize_token(text);
    if (token == "trace")
        return Logger::Level::L_TRACE;
    if (token == "debug")
        return Logger::Level::L_DEBUG;
    if (token == "info")
        return Logger::Level::L_INFO;
    if (token == "warn" || token == "warning")
        return Logger::Level::L_WARNING;
    if (token == "error")
        return Logger::Level::L_ERROR;
    if (token == "system")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

const char *level_to_string(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE:
        return "trace";
    case Logger::Level::L_DEBUG:
        return "debug";
    case Logger::Level::L_INFO:
        return "info";
    case Logger::Level::L_WARNING:
        return "warn";
    case Logger::Level::L_ERROR:
        return "error";
    case Logger::Level::L_SYSTEM:
        return "system";
    }
    return "info";
}

} // namespace relayhub::utils
