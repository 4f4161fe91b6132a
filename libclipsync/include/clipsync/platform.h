/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for ClipSync
 *
 * This header provides compile-time platform detection and defines
 * the appropriate macros for cross-platform development.
 *
 * ClipSync relies on POSIX sockets and only supports Linux.
 */

#ifndef CLIPSYNC_PLATFORM_H
#define CLIPSYNC_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if defined(__linux__)
#define CLIPSYNC_PLATFORM_LINUX 1
#define CLIPSYNC_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. ClipSync only supports Linux."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define CLIPSYNC_COMPILER_CLANG 1
#define CLIPSYNC_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define CLIPSYNC_COMPILER_GCC 1
#define CLIPSYNC_COMPILER_NAME "GCC"
#else
#define CLIPSYNC_COMPILER_UNKNOWN 1
#define CLIPSYNC_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPSYNC_BUILDING_SHARED
#define CLIPSYNC_API __attribute__((visibility("default")))
#else
#define CLIPSYNC_API
#endif

#define CLIPSYNC_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define CLIPSYNC_UNUSED(x) (void)(x)

// Branch prediction hints
#define CLIPSYNC_LIKELY(x) __builtin_expect(!!(x), 1)
#define CLIPSYNC_UNLIKELY(x) __builtin_expect(!!(x), 0)

// ============================================================================
// Debug/Release Detection
// ============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define CLIPSYNC_DEBUG 1
#else
#define CLIPSYNC_RELEASE 1
#endif

#endif // CLIPSYNC_PLATFORM_H
