// ============================================================================
// PvRecorder - Source/Core/Recorder/LibraryPath.hpp
// ----------------------------------------------------------------------------
// Purpose : Default location of the prebuilt native recorder for the current
//           OS/architecture, and the helpers behind it.
// Contract: Pure path computation; nothing here loads or checks the file.
//           The builder receives the resolver as an injectable function, so
//           the lifecycle code never inspects the platform on its own.
// Notes   : PVR_DEFAULT_LIBRARY_DIR is set by the build (defaults to "lib/").
//           On Linux ARM the binary depends on the Raspberry Pi core, read
//           from the "CPU part" line of /proc/cpuinfo.
// ============================================================================

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#ifndef PVR_DEFAULT_LIBRARY_DIR
#  define PVR_DEFAULT_LIBRARY_DIR "lib/"
#endif

namespace pvr::recorder
{
    using LibraryPathResolver = std::filesystem::path (*)();

    inline constexpr std::string_view kUnsupportedMachine = "unsupported";

    // PVR_DEFAULT_LIBRARY_DIR / platform-relative path.
    [[nodiscard]] std::filesystem::path DefaultLibraryPath();

    // Path relative to the library directory for this build's target.
    [[nodiscard]] std::filesystem::path BaseLibraryPath();

    // "CPU part" value (e.g. "0xd08") from /proc/cpuinfo text, lower-cased.
    // Empty when the line is absent.
    [[nodiscard]] std::string ParseCpuPart(std::string_view cpuInfo);

    // Maps a CPU part to a Raspberry Pi machine name ("cortex-a72", ...) or
    // kUnsupportedMachine.
    [[nodiscard]] std::string_view MachineFromCpuPart(std::string_view cpuPart) noexcept;

    // raspberry-pi/<machine>[-aarch64]/libpv_recorder.so; unsupported machines
    // fall back to the arm11 build.
    [[nodiscard]] std::filesystem::path RaspberryPiLibraryPath(std::string_view machine, bool isAarch64);
} // namespace pvr::recorder
