// ============================================================================
// PvRecorder - Source/Core/Recorder/LibraryPath.cpp
// ============================================================================

#include "Core/Recorder/LibraryPath.hpp"

#include "Core/Logger.hpp"
#include "Core/Platform/PlatformDefines.hpp"
#include "Core/Types.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace pvr::recorder
{
namespace
{
    [[nodiscard]] std::string_view Trim(std::string_view text) noexcept
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        {
            text.remove_suffix(1);
        }
        return text;
    }

#if PVR_PLATFORM_LINUX_ARM
    [[nodiscard]] std::string FindMachineType()
    {
        std::ifstream cpuInfoFile("/proc/cpuinfo");
        if (!cpuInfoFile)
        {
            PVR_LOG_WARNING("Platform", "failed to read /proc/cpuinfo, using fallback");
            return std::string(kUnsupportedMachine);
        }

        std::ostringstream contents;
        contents << cpuInfoFile.rdbuf();
        const std::string cpuPart = ParseCpuPart(contents.str());
        if (cpuPart.empty())
        {
            PVR_LOG_WARNING("Platform", "could not find CPU part in /proc/cpuinfo, using fallback");
            return std::string(kUnsupportedMachine);
        }

        return std::string(MachineFromCpuPart(cpuPart));
    }
#endif
} // namespace

std::string ParseCpuPart(std::string_view cpuInfo)
{
    constexpr std::string_view kKey = "CPU part";

    while (!cpuInfo.empty())
    {
        const usize eol = cpuInfo.find('\n');
        std::string_view line = cpuInfo.substr(0, eol);
        cpuInfo = (eol == std::string_view::npos) ? std::string_view{} : cpuInfo.substr(eol + 1);

        if (line.find(kKey) == std::string_view::npos)
        {
            continue;
        }

        // "CPU part\t: 0xd08" -> last whitespace-separated token.
        line = Trim(line);
        const usize lastSpace = line.find_last_of(" \t");
        std::string part(lastSpace == std::string_view::npos ? line : line.substr(lastSpace + 1));
        std::transform(part.begin(), part.end(), part.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return part;
    }

    return {};
}

std::string_view MachineFromCpuPart(std::string_view cpuPart) noexcept
{
    if (cpuPart == "0xb76") return "arm11";
    if (cpuPart == "0xd03") return "cortex-a53";
    if (cpuPart == "0xd08") return "cortex-a72";
    if (cpuPart == "0xd0b") return "cortex-a76";
    return kUnsupportedMachine;
}

std::filesystem::path RaspberryPiLibraryPath(std::string_view machine, bool isAarch64)
{
    if (machine == kUnsupportedMachine || machine.empty())
    {
        PVR_LOG_WARNING("Platform",
            "Device not officially supported. Falling back to the armv6-based (Raspberry Pi Zero) library. "
            "This is not tested nor optimal.");
        return std::filesystem::path("raspberry-pi/arm11/libpv_recorder.so");
    }

    std::string directory(machine);
    if (isAarch64)
    {
        directory += "-aarch64";
    }
    return std::filesystem::path("raspberry-pi") / directory / "libpv_recorder.so";
}

std::filesystem::path BaseLibraryPath()
{
#if PVR_PLATFORM_APPLE && PVR_CPU_X64
    return std::filesystem::path("mac/x86_64/libpv_recorder.dylib");
#elif PVR_PLATFORM_APPLE && PVR_CPU_ARM64
    return std::filesystem::path("mac/arm64/libpv_recorder.dylib");
#elif PVR_PLATFORM_WINDOWS && PVR_CPU_X64
    return std::filesystem::path("windows/amd64/libpv_recorder.dll");
#elif PVR_PLATFORM_WINDOWS && PVR_CPU_ARM64
    return std::filesystem::path("windows/arm64/libpv_recorder.dll");
#elif PVR_PLATFORM_LINUX && PVR_CPU_X64
    return std::filesystem::path("linux/x86_64/libpv_recorder.so");
#elif PVR_PLATFORM_LINUX_ARM
    return RaspberryPiLibraryPath(FindMachineType(), PVR_CPU_ARM64 != 0);
#else
    PVR_LOG_WARNING("Platform", "no prebuilt recorder for this platform, using '{}'", PVR_NATIVE_LIBRARY_FILE_NAME);
    return std::filesystem::path(PVR_NATIVE_LIBRARY_FILE_NAME);
#endif
}

std::filesystem::path DefaultLibraryPath()
{
    return std::filesystem::path(PVR_DEFAULT_LIBRARY_DIR) / BaseLibraryPath();
}

} // namespace pvr::recorder
