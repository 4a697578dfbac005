// ============================================================================
// PvRecorder - tests/Fakes/FakeRecorderModule.cpp
// ----------------------------------------------------------------------------
// Purpose : Shared-library build of the fake native recorder, exporting the
//           real pv_recorder_* names so the dynamic loader can be exercised
//           end to end.
// Contract: Built with PV_RECORDER_EXPORTS. When FAKE_RECORDER_OMIT_VERSION is
//           defined, pv_recorder_version is not exported (missing-symbol test).
//           fake_recorder_state() exposes this image's FakeRecorderState.
// ============================================================================

#include "Fakes/FakeRecorderNative.hpp"

using namespace pvr::testing;

extern "C"
{

PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_init(
    int32_t frame_length, int32_t device_index, int32_t buffered_frames_count, pv_recorder_t** object)
{
    return FakeInit(frame_length, device_index, buffered_frames_count, object);
}

PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_delete(pv_recorder_t* object)
{
    FakeDelete(object);
}

PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_start(pv_recorder_t* object)
{
    return FakeStart(object);
}

PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_stop(pv_recorder_t* object)
{
    return FakeStop(object);
}

PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_read(pv_recorder_t* object, int16_t* pcm)
{
    return FakeRead(object, pcm);
}

PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_set_debug_logging(
    pv_recorder_t* object, pv_recorder_bool_t is_debug_logging_enabled)
{
    FakeSetDebugLogging(object, is_debug_logging_enabled);
}

PV_RECORDER_API pv_recorder_bool_t PV_RECORDER_CALL pv_recorder_get_is_recording(pv_recorder_t* object)
{
    return FakeGetIsRecording(object);
}

PV_RECORDER_API const char* PV_RECORDER_CALL pv_recorder_get_selected_device(pv_recorder_t* object)
{
    return FakeGetSelectedDevice(object);
}

PV_RECORDER_API pv_recorder_status_t PV_RECORDER_CALL pv_recorder_get_available_devices(
    int32_t* device_list_length, char*** device_list)
{
    return FakeGetAvailableDevices(device_list_length, device_list);
}

PV_RECORDER_API void PV_RECORDER_CALL pv_recorder_free_available_devices(
    int32_t device_list_length, char** device_list)
{
    FakeFreeAvailableDevices(device_list_length, device_list);
}

PV_RECORDER_API int32_t PV_RECORDER_CALL pv_recorder_sample_rate(void)
{
    return FakeSampleRate();
}

#if !defined(FAKE_RECORDER_OMIT_VERSION)
PV_RECORDER_API const char* PV_RECORDER_CALL pv_recorder_version(void)
{
    return FakeVersion();
}
#endif

// Test hook: the fake state living inside this module image.
PV_RECORDER_API void* PV_RECORDER_CALL fake_recorder_state(void)
{
    return &FakeState();
}

} // extern "C"
