/**
 * @file platform.cpp
 * @brief Cross-platform implementations for process and thread identity queries.
 *
 * Used by the logger to stamp every record with the emitting process and thread.
 */
#include "rlh_platform.hpp"

#include <functional>
#include <thread>

#if defined(RELAYHUB_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifndef RELAYHUB_VERSION_STRING
#define RELAYHUB_VERSION_STRING "0.0.0"
#endif

namespace relayhub::platform
{

uint64_t get_pid() noexcept
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#elif defined(RELAYHUB_IS_POSIX)
    return static_cast<uint64_t>(getpid());
#else
    return 0;
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most specific OS API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`), falling back to a hash of
 *          `std::thread::id`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(RELAYHUB_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(RELAYHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

const char *get_version_string() noexcept
{
    return RELAYHUB_VERSION_STRING;
}

} // namespace relayhub::platform
