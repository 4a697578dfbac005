// =============================
// PlatformDefines.hpp
// =============================
#pragma once

// Pure preprocessor platform detection (OS, arch, shared-library naming).
// Keep this header *very* lightweight: no runtime logic, no external deps.
// Only the default library path resolver and the loader consume it.

// -----------------------------
// OS Detection
// -----------------------------
#if defined(_WIN32) || defined(_WIN64)
#define PVR_PLATFORM_WINDOWS 1
#else
#define PVR_PLATFORM_WINDOWS 0
#endif

#if defined(__linux__)
#define PVR_PLATFORM_LINUX 1
#else
#define PVR_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
#define PVR_PLATFORM_APPLE 1
#else
#define PVR_PLATFORM_APPLE 0
#endif

// -----------------------------
// CPU Architecture
// -----------------------------
#if defined(_M_X64) || defined(__x86_64__)
#define PVR_CPU_X64 1
#else
#define PVR_CPU_X64 0
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
#define PVR_CPU_ARM64 1
#else
#define PVR_CPU_ARM64 0
#endif

#if defined(__arm__) && !defined(__aarch64__)
#define PVR_CPU_ARM32 1
#else
#define PVR_CPU_ARM32 0
#endif

// -----------------------------
// Shared library naming
// -----------------------------
#if PVR_PLATFORM_WINDOWS
#define PVR_SHARED_LIBRARY_SUFFIX ".dll"
#elif PVR_PLATFORM_APPLE
#define PVR_SHARED_LIBRARY_SUFFIX ".dylib"
#else
#define PVR_SHARED_LIBRARY_SUFFIX ".so"
#endif

#define PVR_NATIVE_LIBRARY_FILE_NAME "libpv_recorder" PVR_SHARED_LIBRARY_SUFFIX

// -----------------------------
// Composite flags
// -----------------------------
// Raspberry Pi class boards: the prebuilt binary depends on the exact core.
#define PVR_PLATFORM_LINUX_ARM (PVR_PLATFORM_LINUX && (PVR_CPU_ARM32 || PVR_CPU_ARM64))


// -----------------------------
// Sanity guards
// -----------------------------
#if ((PVR_PLATFORM_WINDOWS + PVR_PLATFORM_LINUX + PVR_PLATFORM_APPLE) > 1)
#error "PVR: At most one of PVR_PLATFORM_WINDOWS/LINUX/APPLE may be 1."
#endif

// Keep this file preprocessor-only.
