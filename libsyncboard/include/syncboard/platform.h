/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for SyncBoard
 *
 * SyncBoard targets POSIX hosts (Linux first). The server binds a single
 * TCP port and serves WebSocket and HTTP from it.
 */

#ifndef SYNCBOARD_PLATFORM_H
#define SYNCBOARD_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SYNCBOARD_PLATFORM_LINUX 1
#define SYNCBOARD_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
#define SYNCBOARD_PLATFORM_MACOS 1
#define SYNCBOARD_PLATFORM_NAME "macOS"
#elif defined(__unix__)
#define SYNCBOARD_PLATFORM_UNIX 1
#define SYNCBOARD_PLATFORM_NAME "Unix"
#else
#error "Unsupported platform. SyncBoard requires a POSIX host."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define SYNCBOARD_COMPILER_CLANG 1
#define SYNCBOARD_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define SYNCBOARD_COMPILER_GCC 1
#define SYNCBOARD_COMPILER_NAME "GCC"
#else
#define SYNCBOARD_COMPILER_UNKNOWN 1
#define SYNCBOARD_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef SYNCBOARD_BUILDING_SHARED
#define SYNCBOARD_API __attribute__((visibility("default")))
#else
#define SYNCBOARD_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

#define SYNCBOARD_UNUSED(x) (void)(x)

#define SYNCBOARD_LIKELY(x) __builtin_expect(!!(x), 1)
#define SYNCBOARD_UNLIKELY(x) __builtin_expect(!!(x), 0)

// ============================================================================
// Debug/Release Detection
// ============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define SYNCBOARD_DEBUG 1
#else
#define SYNCBOARD_RELEASE 1
#endif

#endif // SYNCBOARD_PLATFORM_H
