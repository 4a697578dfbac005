// ============================================================================
// PvRecorder - Source/Tools/RecorderDemo/RecorderDemo_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Command-line demo: list input devices, or record a number of
//           frames and print the level of each one.
// Notes   : --num_frames 0 records until the process is interrupted.
//           Exit code 0 on success, 1 on bad arguments, 2 on recorder errors.
// ============================================================================

#include "Core/Logger.hpp"
#include "Core/Recorder/PvRecorder.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using namespace pvr::recorder;

    struct DemoArgs
    {
        std::string libraryPath;
        bool showAudioDevices = false;
        int audioDeviceIndex = kDefaultDeviceIndex;
        int frameLength = kDefaultFrameLength;
        int numFrames = 100;
        bool debugLogging = false;
        bool help = false;
    };

    void PrintUsage()
    {
        std::println("usage: RecorderDemo [--library_path PATH] [--show_audio_devices]\n"
                     "                    [--audio_device_index N] [--frame_length N]\n"
                     "                    [--num_frames N] [--debug_logging]");
    }

    [[nodiscard]] bool ParseArgs(int argc, char** argv, DemoArgs& args)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view a{ argv[i] };
            if (a == "--library_path" && i + 1 < argc) { args.libraryPath = argv[++i]; }
            else if (a == "--show_audio_devices") { args.showAudioDevices = true; }
            else if (a == "--audio_device_index" && i + 1 < argc) { args.audioDeviceIndex = std::atoi(argv[++i]); }
            else if (a == "--frame_length" && i + 1 < argc) { args.frameLength = std::atoi(argv[++i]); }
            else if (a == "--num_frames" && i + 1 < argc) { args.numFrames = std::atoi(argv[++i]); }
            else if (a == "--debug_logging") { args.debugLogging = true; }
            else if (a == "--help" || a == "-h") { args.help = true; }
            else
            {
                std::println(stderr, "unknown or incomplete argument '{}'", a);
                return false;
            }
        }
        return args.numFrames >= 0;
    }

    // Root mean square of the frame, in dB relative to full scale.
    [[nodiscard]] double FrameDbfs(const std::vector<pvr::Sample>& frame) noexcept
    {
        if (frame.empty())
        {
            return -120.0;
        }

        double sumSquares = 0.0;
        for (const pvr::Sample s : frame)
        {
            const double normalized = static_cast<double>(s) / 32768.0;
            sumSquares += normalized * normalized;
        }
        const double rms = std::sqrt(sumSquares / static_cast<double>(frame.size()));
        return (rms > 1e-6) ? 20.0 * std::log10(rms) : -120.0;
    }

    int ShowDevices(const PvRecorderBuilder& builder)
    {
        std::vector<std::string> devices;
        const RecorderError error = builder.GetAvailableDevices(devices);
        if (!error.IsOk())
        {
            std::println(stderr, "failed to list devices: {}", FormatRecorderError(error));
            return 2;
        }

        for (std::size_t i = 0; i < devices.size(); ++i)
        {
            std::println("index: {}, device name: {}", i, devices[i]);
        }
        return 0;
    }

    int Record(const PvRecorderBuilder& builder, const DemoArgs& args)
    {
        PvRecorder recorder;
        RecorderError error = builder.Init(recorder);
        if (!error.IsOk())
        {
            std::println(stderr, "failed to initialize recorder: {}", FormatRecorderError(error));
            return 2;
        }

        recorder.SetDebugLogging(args.debugLogging);
        std::println("{}", recorder.Describe());

        error = recorder.Start();
        if (!error.IsOk())
        {
            std::println(stderr, "failed to start: {}", FormatRecorderError(error));
            return 2;
        }

        std::vector<pvr::Sample> frame;
        for (int i = 0; args.numFrames == 0 || i < args.numFrames; ++i)
        {
            error = recorder.Read(frame);
            if (!error.IsOk())
            {
                std::println(stderr, "read failed at frame {}: {}", i, FormatRecorderError(error));
                const RecorderError stopError = recorder.Stop();
                if (!stopError.IsOk())
                {
                    std::println(stderr, "failed to stop: {}", FormatRecorderError(stopError));
                }
                return 2;
            }
            std::println("frame {:>5}: {:7.2f} dBFS", i, FrameDbfs(frame));
        }

        error = recorder.Stop();
        if (!error.IsOk())
        {
            std::println(stderr, "failed to stop: {}", FormatRecorderError(error));
            return 2;
        }
        return 0;
    }
} // namespace

int main(int argc, char** argv)
{
    pvr::core::Logger::ConfigureFromEnvironment();

    DemoArgs args{};
    if (!ParseArgs(argc, argv, args))
    {
        PrintUsage();
        return 1;
    }
    if (args.help)
    {
        PrintUsage();
        return 0;
    }

    PvRecorderBuilder builder(args.frameLength);
    builder.DeviceIndex(args.audioDeviceIndex);
    if (!args.libraryPath.empty())
    {
        builder.LibraryPath(args.libraryPath);
    }

    return args.showAudioDevices ? ShowDevices(builder) : Record(builder, args);
}
