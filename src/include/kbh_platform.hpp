#pragma once
/**
 * @file kbh_platform.hpp
 * @brief Layer 0: Platform detection and language-standard checks.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (KANBANHUB_PLATFORM_LINUX, KANBANHUB_IS_POSIX, etc.) should
 * include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define KANBANHUB_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define KANBANHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define KANBANHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define KANBANHUB_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(_WIN64)
#define KANBANHUB_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define KANBANHUB_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define KANBANHUB_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define KANBANHUB_PLATFORM_LINUX 1
#else
#define KANBANHUB_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(KANBANHUB_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(KANBANHUB_PLATFORM_WIN64)
#define KANBANHUB_IS_WINDOWS 1
#elif defined(KANBANHUB_PLATFORM_APPLE) || defined(KANBANHUB_PLATFORM_FREEBSD) ||                 \
    defined(KANBANHUB_PLATFORM_LINUX)
#define KANBANHUB_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses concepts, designated initializers and std::bind_front.
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "kanbanhub_utils_export.h"

namespace kanbanhub::platform
{

/**
 * @brief Returns the current process id.
 */
KANBANHUB_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Returns a platform-native id for the calling thread (used in log lines).
 */
KANBANHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

} // namespace kanbanhub::platform
