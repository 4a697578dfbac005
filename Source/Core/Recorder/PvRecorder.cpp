// ============================================================================
// PvRecorder - Source/Core/Recorder/PvRecorder.cpp
// ============================================================================

#include "Core/Recorder/PvRecorder.hpp"

#include "Core/Diagnostics/Check.hpp"
#include "Core/Logger.hpp"
#include "Core/Recorder/DeviceEnumerator.hpp"

#include <format>
#include <utility>

namespace pvr::recorder
{
RecorderError ValidateRecorderConfig(const RecorderConfig& config) noexcept
{
    if (config.frameLength <= 0)
    {
        return MakeRecorderError(RecorderErrorKind::ArgumentError,
            "frame_length must be greater than 0, got: {}", config.frameLength);
    }

    if (config.deviceIndex < -1)
    {
        return MakeRecorderError(RecorderErrorKind::ArgumentError,
            "device_index must be >= -1, got: {}", config.deviceIndex);
    }

    if (config.bufferedFramesCount <= 0)
    {
        return MakeRecorderError(RecorderErrorKind::ArgumentError,
            "buffered_frames_count must be greater than 0, got: {}", config.bufferedFramesCount);
    }

    return RecorderOk();
}

// ----------------------------------------------------------------------------
// PvRecorder
// ----------------------------------------------------------------------------

PvRecorder::PvRecorder(std::shared_ptr<RecorderSession> session) noexcept
    : m_session(std::move(session))
{
}

RecorderSession& PvRecorder::Session() const noexcept
{
    PVR_CONTRACT(m_session != nullptr, "{}", "PvRecorder used before a successful Init()");
    return *m_session;
}

RecorderError PvRecorder::Start() const noexcept
{
    return Session().Start();
}

RecorderError PvRecorder::Stop() const noexcept
{
    return Session().Stop();
}

RecorderError PvRecorder::Read(std::vector<Sample>& outFrame) const
{
    RecorderSession& session = Session();
    std::vector<Sample> frame(session.GetFrameLength(), Sample{ 0 });
    const RecorderError error = session.ReadInto(frame);
    if (error.IsOk())
    {
        outFrame = std::move(frame);
    }
    return error;
}

RecorderError PvRecorder::ReadInto(std::span<Sample> buffer) const noexcept
{
    return Session().ReadInto(buffer);
}

void PvRecorder::SetDebugLogging(bool isDebugLoggingEnabled) const noexcept
{
    Session().SetDebugLogging(isDebugLoggingEnabled);
}

bool PvRecorder::IsRecording() const noexcept
{
    return Session().IsRecording();
}

u32 PvRecorder::GetFrameLength() const noexcept
{
    return Session().GetFrameLength();
}

u32 PvRecorder::GetSampleRate() const noexcept
{
    return Session().GetSampleRate();
}

const std::string& PvRecorder::GetSelectedDevice() const noexcept
{
    return Session().GetSelectedDevice();
}

const std::string& PvRecorder::GetVersion() const noexcept
{
    return Session().GetVersion();
}

std::string PvRecorder::Describe() const
{
    if (!m_session)
    {
        return "PvRecorder { <empty> }";
    }

    return std::format(
        "PvRecorder {{ frame_length: {}, sample_rate: {}, selected_device: \"{}\", version: \"{}\", is_recording: {} }}",
        m_session->GetFrameLength(), m_session->GetSampleRate(), m_session->GetSelectedDevice(),
        m_session->GetVersion(), m_session->IsRecording());
}

// ----------------------------------------------------------------------------
// PvRecorderBuilder
// ----------------------------------------------------------------------------

PvRecorderBuilder::PvRecorderBuilder()
    : PvRecorderBuilder(kDefaultFrameLength)
{
}

PvRecorderBuilder::PvRecorderBuilder(i32 frameLength)
    : PvRecorderBuilder(frameLength, &DefaultLibraryPath)
{
}

PvRecorderBuilder::PvRecorderBuilder(i32 frameLength, LibraryPathResolver resolveLibraryPath)
{
    m_config.frameLength = frameLength;
    if (resolveLibraryPath)
    {
        m_config.libraryPath = resolveLibraryPath();
    }
}

PvRecorderBuilder& PvRecorderBuilder::FrameLength(i32 frameLength) noexcept
{
    m_config.frameLength = frameLength;
    return *this;
}

PvRecorderBuilder& PvRecorderBuilder::DeviceIndex(i32 deviceIndex) noexcept
{
    m_config.deviceIndex = deviceIndex;
    return *this;
}

PvRecorderBuilder& PvRecorderBuilder::BufferedFramesCount(i32 bufferedFramesCount) noexcept
{
    m_config.bufferedFramesCount = bufferedFramesCount;
    return *this;
}

PvRecorderBuilder& PvRecorderBuilder::LibraryPath(std::filesystem::path libraryPath) noexcept
{
    m_config.libraryPath = std::move(libraryPath);
    return *this;
}

RecorderSessionDesc PvRecorderBuilder::MakeSessionDesc() const noexcept
{
    RecorderSessionDesc desc{};
    desc.frameLength = m_config.frameLength;
    desc.deviceIndex = m_config.deviceIndex;
    desc.bufferedFramesCount = m_config.bufferedFramesCount;
    return desc;
}

RecorderError PvRecorderBuilder::Init(PvRecorder& outRecorder) const
{
    const RecorderError validation = ValidateRecorderConfig(m_config);
    if (!validation.IsOk())
    {
        PVR_LOG_ERROR("Recorder", "rejected configuration: {}", validation.Message());
        return validation;
    }

    const std::string path = m_config.libraryPath.string();
    std::shared_ptr<RecorderSession> session;
    const RecorderError error = RecorderSession::Create(MakeSessionDesc(), path.c_str(), session);
    if (!error.IsOk())
    {
        return error;
    }

    outRecorder = PvRecorder(std::move(session));
    return RecorderOk();
}

RecorderError PvRecorderBuilder::Init(RecorderLibrary&& library, PvRecorder& outRecorder) const
{
    const RecorderError validation = ValidateRecorderConfig(m_config);
    if (!validation.IsOk())
    {
        PVR_LOG_ERROR("Recorder", "rejected configuration: {}", validation.Message());
        return validation;
    }

    std::shared_ptr<RecorderSession> session;
    const RecorderError error = RecorderSession::Create(MakeSessionDesc(), std::move(library), session);
    if (!error.IsOk())
    {
        return error;
    }

    outRecorder = PvRecorder(std::move(session));
    return RecorderOk();
}

RecorderError PvRecorderBuilder::GetAvailableDevices(std::vector<std::string>& outDevices) const
{
    const std::string path = m_config.libraryPath.string();
    return recorder::GetAvailableDevices(path.c_str(), outDevices);
}

} // namespace pvr::recorder
