// ============================================================================
// PvRecorder - Source/Core/Recorder/RecorderSession.cpp
// ----------------------------------------------------------------------------
// Purpose : Native handle lifecycle: init, status-checked forwards, teardown.
// Contract: Native truth values cross the boundary as 'int' in both directions.
//           The destructor runs pv_recorder_delete before the library
//           mapping is released.
// ============================================================================

#include "Core/Recorder/RecorderSession.hpp"

#include "Core/Diagnostics/Check.hpp"
#include "Core/Logger.hpp"
#include "Core/Recorder/NativeString.hpp"

#include <utility>

namespace pvr::recorder
{
RecorderSession::RecorderSession(ConstructionKey, RecorderLibrary&& library) noexcept
    : m_library(std::move(library))
{
}

RecorderSession::~RecorderSession() noexcept
{
    if (m_handle)
    {
        m_library.EntryPoints().destroy(m_handle);
        m_handle = nullptr;
        PVR_LOG_VERBOSE("Recorder", "native recorder deleted");
    }

    m_library.Reset();
}

RecorderError RecorderSession::Create(const RecorderSessionDesc& desc,
                                      RecorderLibrary&& library,
                                      std::shared_ptr<RecorderSession>& outSession)
{
    RecorderLibrary owned = std::move(library);
    if (!owned.IsValid())
    {
        return MakeRecorderError(RecorderErrorKind::LibraryLoadFailure,
            "pvrecorder entry point table is empty");
    }

    // The session exists before native init so that any later failure still
    // routes the handle through the destructor.
    std::shared_ptr<RecorderSession> session =
        std::make_shared<RecorderSession>(ConstructionKey{}, std::move(owned));
    const RecorderEntryPoints& api = session->m_library.EntryPoints();

    pv_recorder_t* handle = nullptr;
    const pv_recorder_status_t status =
        api.init(desc.frameLength, desc.deviceIndex, desc.bufferedFramesCount, &handle);
    RecorderError error = CheckNativeStatus(status, PV_RECORDER_SYMBOL_INIT);
    if (!error.IsOk())
    {
        return error;
    }

    if (handle == nullptr)
    {
        PVR_LOG_ERROR("Recorder", "pv_recorder_init reported SUCCESS with a null recorder");
        return MakeRecorderError(RecorderErrorKind::InternalError,
            "pv_recorder_init returned SUCCESS but pointer is null");
    }

    session->m_handle = handle;
    session->m_frameLength = static_cast<u32>(desc.frameLength);

    error = CopyNativeString(api.getSelectedDevice(handle), "selected device", session->m_selectedDevice);
    if (!error.IsOk())
    {
        return error;
    }

    const i32 sampleRate = api.sampleRate();
    if (sampleRate <= 0)
    {
        PVR_LOG_ERROR("Recorder", "pv_recorder_sample_rate returned {}", sampleRate);
        return MakeRecorderError(RecorderErrorKind::InternalError,
            "pv_recorder_sample_rate returned a non-positive rate: {}", sampleRate);
    }
    session->m_sampleRate = static_cast<u32>(sampleRate);

    error = CopyNativeString(api.version(), "version", session->m_version);
    if (!error.IsOk())
    {
        return error;
    }

    PVR_LOG_INFO("Recorder", "recorder ready: device='{}' frame_length={} sample_rate={} version={}",
        session->m_selectedDevice, session->m_frameLength, session->m_sampleRate, session->m_version);

    outSession = std::move(session);
    return RecorderOk();
}

RecorderError RecorderSession::Create(const RecorderSessionDesc& desc,
                                      const char* libraryPath,
                                      std::shared_ptr<RecorderSession>& outSession)
{
    RecorderLibrary library;
    const RecorderError loadError = RecorderLibrary::Load(libraryPath, library);
    if (!loadError.IsOk())
    {
        return loadError;
    }
    return Create(desc, std::move(library), outSession);
}

RecorderError RecorderSession::Start() noexcept
{
    PVR_ASSERT(m_handle != nullptr, "recorder handle used after teardown");
    const pv_recorder_status_t status = m_library.EntryPoints().start(m_handle);
    return CheckNativeStatus(status, PV_RECORDER_SYMBOL_START);
}

RecorderError RecorderSession::Stop() noexcept
{
    PVR_ASSERT(m_handle != nullptr, "recorder handle used after teardown");
    const pv_recorder_status_t status = m_library.EntryPoints().stop(m_handle);
    return CheckNativeStatus(status, PV_RECORDER_SYMBOL_STOP);
}

RecorderError RecorderSession::ReadInto(std::span<Sample> buffer) noexcept
{
    PVR_CONTRACT(buffer.size() >= m_frameLength,
        "buffer length {} is less than frame_length {}", buffer.size(), m_frameLength);
    PVR_ASSERT(m_handle != nullptr, "recorder handle used after teardown");

    const pv_recorder_status_t status = m_library.EntryPoints().read(m_handle, buffer.data());
    return CheckNativeStatus(status, PV_RECORDER_SYMBOL_READ);
}

void RecorderSession::SetDebugLogging(bool isDebugLoggingEnabled) noexcept
{
    const pv_recorder_bool_t flag = isDebugLoggingEnabled ? 1 : 0;
    m_library.EntryPoints().setDebugLogging(m_handle, flag);
}

bool RecorderSession::IsRecording() const noexcept
{
    const pv_recorder_bool_t recording = m_library.EntryPoints().getIsRecording(m_handle);
    return recording != 0;
}

} // namespace pvr::recorder
