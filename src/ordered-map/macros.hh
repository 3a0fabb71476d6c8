#pragma once

// Toolchain and build-mode detection shared by all ordered-map headers.
// Every macro here is either defined or not, except OM_ASSERT_ENABLED which is always 0 or 1.

// compilers: OM_COMPILER_MSVC, OM_COMPILER_CLANG, OM_COMPILER_GCC
// OM_COMPILER_POSIX covers the GNU-compatible ones (attributes, builtins, raise())
#if defined(_MSC_VER)
#define OM_COMPILER_MSVC
#elif defined(__clang__)
#define OM_COMPILER_CLANG
#define OM_COMPILER_POSIX
#elif defined(__GNUC__)
#define OM_COMPILER_GCC
#define OM_COMPILER_POSIX
#else
#error "ordered-map: unsupported compiler"
#endif

// platforms: OM_OS_WINDOWS, OM_OS_LINUX, OM_OS_APPLE
// only Windows and Linux get special treatment (aligned allocation, debugger detection)
#if defined(_WIN32)
#define OM_OS_WINDOWS
#elif defined(__linux__)
#define OM_OS_LINUX
#elif defined(__APPLE__)
#define OM_OS_APPLE
#endif

// build mode, set by CMake: OM_DEBUG, OM_RELWITHDEBINFO, OM_RELEASE
// assertions stay on everywhere except plain release builds,
// OM_ENABLE_ASSERT_IN_RELEASE keeps them on there too
#ifndef OM_ASSERT_ENABLED
#if defined(OM_RELEASE) && !defined(OM_ENABLE_ASSERT_IN_RELEASE)
#define OM_ASSERT_ENABLED 0
#else
#define OM_ASSERT_ENABLED 1
#endif
#endif

#if defined(OM_COMPILER_MSVC)
#define OM_FORCE_INLINE __forceinline
#define OM_COLD_FUNC
#else
#define OM_FORCE_INLINE __attribute__((always_inline)) inline
#define OM_COLD_FUNC __attribute__((cold)) // error paths, assertion reports, reallocation
#endif

// type-checks expr without evaluating it
#define OM_UNUSED(expr) (void)(sizeof((expr)))
