#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "rlh_platform.hpp"

namespace relayhub::utils
{

// Represents a single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Use int to avoid including all of logger.hpp for the enum.
    std::string body;
};

// Abstract interface for a log message destination.
class RELAYHUB_UTILS_EXPORT Sink
{
  public:
    virtual ~Sink() = default;

    /// Writes one record. May throw std::system_error / std::runtime_error on I/O failure;
    /// the logger reports such failures through its write-error callback.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl) noexcept;
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace relayhub::utils
