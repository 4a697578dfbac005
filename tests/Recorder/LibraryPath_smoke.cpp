#include "Core/Recorder/LibraryPath.hpp"

#include <string_view>

int RunLibraryPathSmoke()
{
    using namespace pvr::recorder;

    constexpr std::string_view kPi4CpuInfo =
        "processor\t: 0\n"
        "BogoMIPS\t: 108.00\n"
        "Features\t: fp asimd evtstrm crc32 cpuid\n"
        "CPU implementer\t: 0x41\n"
        "CPU architecture: 8\n"
        "CPU variant\t: 0x0\n"
        "CPU part\t: 0xD08\n"
        "CPU revision\t: 3\n";

    if (ParseCpuPart(kPi4CpuInfo) != "0xd08")
    {
        return 1;
    }
    if (!ParseCpuPart("processor\t: 0\nmodel name\t: ARMv6\n").empty() || !ParseCpuPart("").empty())
    {
        return 2;
    }
    // Last line without a trailing newline.
    if (ParseCpuPart("CPU implementer : 0x41\nCPU part : 0xb76") != "0xb76")
    {
        return 3;
    }

    if (MachineFromCpuPart("0xb76") != "arm11" ||
        MachineFromCpuPart("0xd03") != "cortex-a53" ||
        MachineFromCpuPart("0xd08") != "cortex-a72" ||
        MachineFromCpuPart("0xd0b") != "cortex-a76" ||
        MachineFromCpuPart("0xc07") != kUnsupportedMachine)
    {
        return 4;
    }

    if (RaspberryPiLibraryPath("cortex-a72", true) !=
            std::filesystem::path("raspberry-pi/cortex-a72-aarch64/libpv_recorder.so") ||
        RaspberryPiLibraryPath("cortex-a53", false) !=
            std::filesystem::path("raspberry-pi/cortex-a53/libpv_recorder.so"))
    {
        return 5;
    }

    // Unknown boards fall back to the armv6 build regardless of word size.
    if (RaspberryPiLibraryPath(kUnsupportedMachine, true) !=
        std::filesystem::path("raspberry-pi/arm11/libpv_recorder.so"))
    {
        return 6;
    }

    const std::filesystem::path defaultPath = DefaultLibraryPath();
    if (defaultPath.empty() || defaultPath.filename().string().find("libpv_recorder") != 0)
    {
        return 7;
    }

    return 0;
}
