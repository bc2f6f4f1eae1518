#include "rlh_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#if defined(RELAYHUB_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace relayhub::utils
{

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
#if defined(RELAYHUB_IS_POSIX)
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': {}", m_path.string(),
                                             std::generic_category().message(errno)));
    }
#else
    m_file = std::fopen(m_path.string().c_str(), "ab");
    if (m_file == nullptr)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}'", m_path.string()));
    }
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#if defined(RELAYHUB_IS_POSIX)
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#else
    if (m_file != nullptr)
    {
        std::fclose(m_file);
        m_file = nullptr;
    }
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const auto content = format_logmsg(msg);
#if defined(RELAYHUB_IS_POSIX)
    if (m_use_flock)
    {
        // flock is advisory; it serializes writers that also use it.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, content.data(), content.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (std::fwrite(content.data(), 1, content.size(), m_file) != content.size())
    {
        throw std::runtime_error("Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(RELAYHUB_IS_POSIX)
    ::fsync(m_fd);
#else
    std::fflush(m_file);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace relayhub::utils
