// ============================================================================
// PvRecorder - Source/Core/Recorder/DeviceEnumerator.hpp
// ----------------------------------------------------------------------------
// Purpose : List the audio input devices known to the native layer.
// Contract: Stateless; does not need a recorder session. All-or-nothing: on any
//           failure outDevices is left untouched. The native list is always
//           released through pv_recorder_free_available_devices once obtained,
//           on success and failure paths alike.
// Notes   : Index i of the result is the device_index to pass to the builder.
// ============================================================================

#pragma once

#include "Core/Interop/RecorderEntryPoints.hpp"
#include "Core/Recorder/RecorderError.hpp"

#include <string>
#include <vector>

namespace pvr::recorder
{
    [[nodiscard]] RecorderError GetAvailableDevices(const RecorderLibrary& library,
                                                    std::vector<std::string>& outDevices);

    // Loads the library at libraryPath for the duration of the call.
    [[nodiscard]] RecorderError GetAvailableDevices(const char* libraryPath,
                                                    std::vector<std::string>& outDevices);
} // namespace pvr::recorder
