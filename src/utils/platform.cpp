/**
 * @file platform.cpp
 * @brief Process and thread identity helpers.
 */
#include "kbh_platform.hpp"

#include <functional>
#include <thread>

#if defined(KANBANHUB_IS_POSIX)
#include <sys/syscall.h>
#include <unistd.h>
#endif
#if defined(KANBANHUB_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace kanbanhub::platform
{

uint64_t get_pid() noexcept
{
#if defined(KANBANHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(KANBANHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(KANBANHUB_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(KANBANHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

} // namespace kanbanhub::platform
