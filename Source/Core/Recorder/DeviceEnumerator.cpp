// ============================================================================
// PvRecorder - Source/Core/Recorder/DeviceEnumerator.cpp
// ============================================================================

#include "Core/Recorder/DeviceEnumerator.hpp"

#include "Core/Logger.hpp"
#include "Core/Platform/PlatformMacros.hpp"
#include "Core/Recorder/NativeString.hpp"

#include <utility>

namespace pvr::recorder
{
RecorderError GetAvailableDevices(const RecorderLibrary& library, std::vector<std::string>& outDevices)
{
    if (!library.IsValid())
    {
        return MakeRecorderError(RecorderErrorKind::LibraryLoadFailure,
            "pvrecorder entry point table is empty");
    }

    const RecorderEntryPoints& api = library.EntryPoints();

    int32_t count = 0;
    char** list = nullptr;
    const pv_recorder_status_t status = api.getAvailableDevices(&count, &list);
    RecorderError error = CheckNativeStatus(status, PV_RECORDER_SYMBOL_GET_AVAILABLE_DEVICES);
    if (!error.IsOk())
    {
        return error;
    }

    PVR_DEFER([&]() noexcept {
        if (list != nullptr)
        {
            // A negative count is never handed back to the native free.
            api.freeAvailableDevices(count < 0 ? 0 : count, list);
        }
    });

    if (count < 0 || (count > 0 && list == nullptr))
    {
        PVR_LOG_ERROR("Devices", "inconsistent device list: count={} list={}",
            count, static_cast<const void*>(list));
        return MakeRecorderError(RecorderErrorKind::InternalError,
            "pv_recorder_get_available_devices returned an inconsistent list (count {})", count);
    }

    std::vector<std::string> devices;
    devices.reserve(static_cast<usize>(count));
    for (int32_t i = 0; i < count; ++i)
    {
        std::string name;
        error = CopyNativeString(list[i], "device", name);
        if (!error.IsOk())
        {
            PVR_LOG_ERROR("Devices", "device {} of {} rejected, discarding list", i, count);
            return error;
        }
        devices.push_back(std::move(name));
    }

    PVR_LOG_VERBOSE("Devices", "{} input device(s) available", devices.size());
    outDevices = std::move(devices);
    return RecorderOk();
}

RecorderError GetAvailableDevices(const char* libraryPath, std::vector<std::string>& outDevices)
{
    RecorderLibrary library;
    const RecorderError loadError = RecorderLibrary::Load(libraryPath, library);
    if (!loadError.IsOk())
    {
        return loadError;
    }
    return GetAvailableDevices(library, outDevices);
}
} // namespace pvr::recorder
