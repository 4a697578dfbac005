// End-to-end smoke for the dynamic-load path against FakeRecorderModule.
#include "Core/Interop/RecorderEntryPoints.hpp"
#include "Core/Interop/SharedLibrary.hpp"
#include "Core/Recorder/PvRecorder.hpp"

#include "Fakes/FakeRecorderNative.hpp"

#include <stdio.h>
#include <string_view>
#include <vector>

#ifndef PVR_FAKE_RECORDER_MODULE_PATH
    #error "PVR_FAKE_RECORDER_MODULE_PATH must name the FakeRecorderModule binary"
#endif
#ifndef PVR_FAKE_RECORDER_MODULE_NO_VERSION_PATH
    #error "PVR_FAKE_RECORDER_MODULE_NO_VERSION_PATH must name the FakeRecorderModuleNoVersion binary"
#endif

static const char* kModulePath = PVR_FAKE_RECORDER_MODULE_PATH;
static const char* kNoVersionModulePath = PVR_FAKE_RECORDER_MODULE_NO_VERSION_PATH;

using namespace pvr::recorder;

static std::filesystem::path ModulePath()
{
    return std::filesystem::path(kModulePath);
}

static bool Contains(const RecorderError& error, std::string_view needle)
{
    return error.Message().find(needle) != std::string_view::npos;
}

int main()
{
    // Nonexistent path.
    pvr::RecorderLibrary library;
    RecorderError error = pvr::RecorderLibrary::Load("no/such/dir/libpv_recorder.so", library);
    if (error.kind != RecorderErrorKind::LibraryLoadFailure ||
        !Contains(error, "Failed to load pvrecorder dynamic library") || library.IsValid())
    {
        printf("nonexistent path: %s\n", FormatRecorderError(error).c_str());
        return 1;
    }

    error = pvr::RecorderLibrary::Load(kModulePath, library);
    if (!error.IsOk() || !library.IsValid() || !library.IsDynamicallyLoaded() ||
        pvr::FindMissingEntryPoint(library.EntryPoints()) != nullptr)
    {
        printf("load failed: %s\n", FormatRecorderError(error).c_str());
        return 2;
    }

    // Missing symbol: named in the error, and the previous table survives.
    const pv_recorder_version_fn previousVersion = library.EntryPoints().version;
    error = pvr::RecorderLibrary::Load(kNoVersionModulePath, library);
    if (error.kind != RecorderErrorKind::LibraryLoadFailure ||
        !Contains(error, "Failed to load function symbol 'pv_recorder_version'") ||
        library.EntryPoints().version != previousVersion)
    {
        printf("missing symbol: %s\n", FormatRecorderError(error).c_str());
        return 3;
    }

    // The same image as the loader's, so counters are shared.
    pvr::SharedLibrary stateModule;
    char stateModuleError[256] = {};
    if (!stateModule.Load(kModulePath, stateModuleError, sizeof(stateModuleError)))
    {
        printf("state module load failed: %s\n", stateModuleError);
        return 4;
    }
    using StateFn = void* (*)();
    auto stateFn = reinterpret_cast<StateFn>(stateModule.ResolveSymbol("fake_recorder_state", stateModuleError, sizeof(stateModuleError)));
    if (stateFn == nullptr)
    {
        printf("state hook missing: %s\n", stateModuleError);
        return 5;
    }
    auto& state = *static_cast<pvr::testing::FakeRecorderState*>(stateFn());

    library.Reset();

    {
        PvRecorderBuilder builder(256, &ModulePath);
        PvRecorder recorder;
        error = builder.Init(recorder);
        if (!error.IsOk())
        {
            printf("init failed: %s\n", FormatRecorderError(error).c_str());
            return 6;
        }
        if (recorder.GetSampleRate() != 16000 || recorder.GetVersion() != "1.2.0" ||
            recorder.GetSelectedDevice().empty() || state.initCalls.load() != 1)
        {
            return 7;
        }

        std::vector<pvr::Sample> frame;
        if (!recorder.Start().IsOk() || !recorder.Read(frame).IsOk() || frame.size() != 256u ||
            !recorder.Stop().IsOk() || recorder.IsRecording())
        {
            return 8;
        }

        std::vector<std::string> devices;
        if (!builder.GetAvailableDevices(devices).IsOk() || devices.size() != state.devices.size() ||
            state.freeDevicesCalls.load() != 1)
        {
            return 9;
        }

        const PvRecorder copy = recorder;
        if (state.deleteCalls.load() != 0)
        {
            return 10;
        }
    }

    if (state.deleteCalls.load() != 1 || state.liveHandles.load() != 0)
    {
        return 11;
    }

    stateModule.Unload();
    return 0;
}
