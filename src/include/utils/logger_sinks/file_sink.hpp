#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace relayhub::utils
{

/**
 * @brief Appends log records to a file. With `use_flock`, each write holds an advisory
 *        exclusive lock (POSIX) so several processes can share one log file.
 */
class RELAYHUB_UTILS_EXPORT FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
#if defined(RELAYHUB_IS_POSIX)
    int m_fd = -1;
#else
    std::FILE *m_file = nullptr;
#endif
};

} // namespace relayhub::utils
