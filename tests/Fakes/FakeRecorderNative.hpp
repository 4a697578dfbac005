// ============================================================================
// PvRecorder - tests/Fakes/FakeRecorderNative.hpp
// ----------------------------------------------------------------------------
// Purpose : In-process stand-in for the native recorder library. Implements
//           all 12 entry points against a process-wide state block with call
//           counters and failure knobs.
// Contract: Test-only. Knobs are plain fields: set them before the code under
//           test runs. Counters are atomic and may be read at any time.
//           Every handle and device list it hands out is tracked so leaks and
//           double frees show up in the counters.
// Notes   : The same implementation is compiled into FakeRecorderModule, which
//           exports the real pv_recorder_* names for the dynamic-load path.
// ============================================================================
#ifndef PVR_TESTS_FAKE_RECORDER_NATIVE_HPP
#define PVR_TESTS_FAKE_RECORDER_NATIVE_HPP

#include "Core/Interop/RecorderEntryPoints.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace pvr::testing
{

struct FakeRecorderState
{
    // Knobs ---------------------------------------------------------------
    pv_recorder_status_t     initStatus = PV_RECORDER_STATUS_SUCCESS;
    bool                     initReturnsNullHandle = false;
    pv_recorder_status_t     readStatus = PV_RECORDER_STATUS_SUCCESS;
    pv_recorder_status_t     devicesStatus = PV_RECORDER_STATUS_SUCCESS;
    bool                     devicesReturnNullList = false;
    bool                     devicesOverrideCount = false;
    i32                      devicesReportedCount = 0;     // Used when devicesOverrideCount.
    pv_recorder_bool_t       recordingTruthValue = 1;      // Returned by get_is_recording while started.
    i32                      sampleRate = 16000;
    std::string              selectedDevice = "Fake USB Microphone";
    std::string              version = "1.2.0";
    std::vector<std::string> devices{ "Fake USB Microphone", "Fake Line In", "Fake Webcam Audio" };
    Sample                   fillSample = 7;

    // Observations --------------------------------------------------------
    std::atomic<i32> initCalls{ 0 };
    std::atomic<i32> deleteCalls{ 0 };
    std::atomic<i32> liveHandles{ 0 };
    std::atomic<i32> readCalls{ 0 };
    std::atomic<i32> getDevicesCalls{ 0 };
    std::atomic<i32> freeDevicesCalls{ 0 };
    std::atomic<i32> liveDeviceLists{ 0 };
    std::atomic<i32> lastFreeCount{ -1 };
    std::atomic<i32> lastDebugLogging{ -1 };
    std::atomic<i32> lastFrameLength{ 0 };
    std::atomic<i32> lastDeviceIndex{ 0 };
    std::atomic<i32> lastBufferedFramesCount{ 0 };
};

// The process-wide fake state (one per module image).
[[nodiscard]] FakeRecorderState& FakeState() noexcept;

// Restores every knob to its default and zeroes every counter.
void ResetFakeState() noexcept;

// Entry-point table pointing at the in-process fake.
[[nodiscard]] RecorderEntryPoints MakeFakeEntryPoints() noexcept;

// Fake implementations, named after the native entry points they replace.
pv_recorder_status_t FakeInit(int32_t frameLength, int32_t deviceIndex, int32_t bufferedFramesCount,
                              pv_recorder_t** object);
void                 FakeDelete(pv_recorder_t* object);
pv_recorder_status_t FakeStart(pv_recorder_t* object);
pv_recorder_status_t FakeStop(pv_recorder_t* object);
pv_recorder_status_t FakeRead(pv_recorder_t* object, int16_t* pcm);
void                 FakeSetDebugLogging(pv_recorder_t* object, pv_recorder_bool_t isDebugLoggingEnabled);
pv_recorder_bool_t   FakeGetIsRecording(pv_recorder_t* object);
const char*          FakeGetSelectedDevice(pv_recorder_t* object);
pv_recorder_status_t FakeGetAvailableDevices(int32_t* deviceListLength, char*** deviceList);
void                 FakeFreeAvailableDevices(int32_t deviceListLength, char** deviceList);
int32_t              FakeSampleRate();
const char*          FakeVersion();

} // namespace pvr::testing

#endif // PVR_TESTS_FAKE_RECORDER_NATIVE_HPP
