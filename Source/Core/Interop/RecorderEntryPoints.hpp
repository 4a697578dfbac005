// ============================================================================
// PvRecorder - Core/Interop/RecorderEntryPoints.hpp
// ----------------------------------------------------------------------------
// Purpose : The fixed table of native recorder entry points, and the owner that
//           keeps the table's backing library mapped.
// Contract: A RecorderLibrary is either empty or holds all 12 entry points;
//           partial tables are never observable. Entry points stay callable
//           for exactly as long as the RecorderLibrary that produced them is
//           alive. Move-only; no exceptions.
// Notes   : The table is the seam between the lifecycle code and the native
//           layer: RecorderLibrary::Load() fills it from a shared library,
//           RecorderLibrary::FromEntryPoints() wraps an in-process table
//           (statically linked native layer or a test double).
// ============================================================================
#ifndef PVR_INTEROP_RECORDER_ENTRY_POINTS_HPP
#define PVR_INTEROP_RECORDER_ENTRY_POINTS_HPP

#include "Core/Abi/PvRecorderAbi.h"
#include "Core/Interop/SharedLibrary.hpp"
#include "Core/Recorder/RecorderError.hpp"

namespace pvr
{

inline constexpr u32 kRecorderEntryPointCount = 12;

struct RecorderEntryPoints
{
    pv_recorder_init_fn                   init = nullptr;
    pv_recorder_delete_fn                 destroy = nullptr; // pv_recorder_delete
    pv_recorder_start_fn                  start = nullptr;
    pv_recorder_stop_fn                   stop = nullptr;
    pv_recorder_read_fn                   read = nullptr;
    pv_recorder_set_debug_logging_fn      setDebugLogging = nullptr;
    pv_recorder_get_is_recording_fn       getIsRecording = nullptr;
    pv_recorder_get_selected_device_fn    getSelectedDevice = nullptr;
    pv_recorder_get_available_devices_fn  getAvailableDevices = nullptr;
    pv_recorder_free_available_devices_fn freeAvailableDevices = nullptr;
    pv_recorder_sample_rate_fn            sampleRate = nullptr;
    pv_recorder_version_fn                version = nullptr;
};

// Returns the exported name of the first null entry, or nullptr when complete.
[[nodiscard]] const char* FindMissingEntryPoint(const RecorderEntryPoints& entryPoints) noexcept;

class RecorderLibrary
{
public:
    RecorderLibrary() noexcept = default;
    ~RecorderLibrary() noexcept = default;

    RecorderLibrary(RecorderLibrary&& other) noexcept;
    RecorderLibrary& operator=(RecorderLibrary&& other) noexcept;

    RecorderLibrary(const RecorderLibrary&) = delete;
    RecorderLibrary& operator=(const RecorderLibrary&) = delete;

    // Purpose : Map the library at path and resolve every entry point.
    // Contract: All-or-nothing. On failure out is left untouched and the error
    //           (LibraryLoadFailure) names the path or the missing symbol.
    [[nodiscard]] static recorder::RecorderError Load(const char* path, RecorderLibrary& out) noexcept;

    // Purpose : Adopt an in-process table; nothing is mapped or unmapped.
    // Contract: Every entry must be non-null, otherwise LibraryLoadFailure
    //           naming the first missing entry and out is left untouched.
    [[nodiscard]] static recorder::RecorderError FromEntryPoints(const RecorderEntryPoints& entryPoints,
                                                                 RecorderLibrary& out) noexcept;

    [[nodiscard]] const RecorderEntryPoints& EntryPoints() const noexcept
    {
        return m_entryPoints;
    }

    [[nodiscard]] bool IsValid() const noexcept
    {
        return m_entryPoints.init != nullptr;
    }

    [[nodiscard]] bool IsDynamicallyLoaded() const noexcept
    {
        return m_library.IsLoaded();
    }

    // Clears the table first, then unmaps.
    void Reset() noexcept;

private:
    SharedLibrary       m_library{};
    RecorderEntryPoints m_entryPoints{};
};

} // namespace pvr

#endif // PVR_INTEROP_RECORDER_ENTRY_POINTS_HPP
