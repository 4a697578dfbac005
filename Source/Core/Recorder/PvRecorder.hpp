// ============================================================================
// PvRecorder - Source/Core/Recorder/PvRecorder.hpp
// ----------------------------------------------------------------------------
// Purpose : Public recorder API: a builder that validates configuration and
//           creates sessions, and a cheap-to-copy recorder handle that
//           forwards to a shared RecorderSession.
// Contract: Every fallible call returns [[nodiscard]] RecorderError; values
//           come back through out-parameters and are written only on success.
//           Argument errors are detected before any native call is made.
//           Copies of a PvRecorder share one native recorder; the last copy
//           to go away deletes it. A default-constructed PvRecorder is empty
//           and calling anything but IsValid() on it aborts.
// Notes   : Read()/ReadInto() block until a frame is ready. Reads issued from
//           several threads are not ordered relative to each other.
// ============================================================================

#pragma once

#include "Core/Interop/RecorderEntryPoints.hpp"
#include "Core/Recorder/LibraryPath.hpp"
#include "Core/Recorder/RecorderError.hpp"
#include "Core/Recorder/RecorderSession.hpp"

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pvr::recorder
{
    inline constexpr i32 kDefaultFrameLength = 512;
    inline constexpr i32 kDefaultDeviceIndex = -1; // System default input.
    inline constexpr i32 kDefaultBufferedFramesCount = 50;

    struct RecorderConfig
    {
        i32                   frameLength = kDefaultFrameLength;
        i32                   deviceIndex = kDefaultDeviceIndex;
        i32                   bufferedFramesCount = kDefaultBufferedFramesCount;
        std::filesystem::path libraryPath{};
    };

    // ArgumentError naming the first offending field and its value, or ok.
    [[nodiscard]] RecorderError ValidateRecorderConfig(const RecorderConfig& config) noexcept;

    class PvRecorder
    {
    public:
        PvRecorder() noexcept = default;

        [[nodiscard]] bool IsValid() const noexcept
        {
            return m_session != nullptr;
        }

        // INVALID_STATE from the native layer means "already started" /
        // "not started"; check with error.Is(NativeStatus::InvalidState).
        [[nodiscard]] RecorderError Start() const noexcept;
        [[nodiscard]] RecorderError Stop() const noexcept;

        // Reads one frame into a new buffer of exactly GetFrameLength() samples.
        [[nodiscard]] RecorderError Read(std::vector<Sample>& outFrame) const;

        // Fills the first GetFrameLength() samples of buffer.
        // Precondition: buffer.size() >= GetFrameLength(); violation aborts.
        [[nodiscard]] RecorderError ReadInto(std::span<Sample> buffer) const noexcept;

        void SetDebugLogging(bool isDebugLoggingEnabled) const noexcept;
        [[nodiscard]] bool IsRecording() const noexcept;

        [[nodiscard]] u32 GetFrameLength() const noexcept;
        [[nodiscard]] u32 GetSampleRate() const noexcept;
        [[nodiscard]] const std::string& GetSelectedDevice() const noexcept;
        [[nodiscard]] const std::string& GetVersion() const noexcept;

        // "PvRecorder { frame_length: .., sample_rate: .., ... }" for logs.
        [[nodiscard]] std::string Describe() const;

    private:
        friend class PvRecorderBuilder;

        explicit PvRecorder(std::shared_ptr<RecorderSession> session) noexcept;

        [[nodiscard]] RecorderSession& Session() const noexcept;

        std::shared_ptr<RecorderSession> m_session{};
    };

    class PvRecorderBuilder
    {
    public:
        // frame length kDefaultFrameLength, library path from DefaultLibraryPath().
        PvRecorderBuilder();
        explicit PvRecorderBuilder(i32 frameLength);
        PvRecorderBuilder(i32 frameLength, LibraryPathResolver resolveLibraryPath);

        PvRecorderBuilder& FrameLength(i32 frameLength) noexcept;
        PvRecorderBuilder& DeviceIndex(i32 deviceIndex) noexcept;
        PvRecorderBuilder& BufferedFramesCount(i32 bufferedFramesCount) noexcept;
        PvRecorderBuilder& LibraryPath(std::filesystem::path libraryPath) noexcept;

        [[nodiscard]] const RecorderConfig& Config() const noexcept
        {
            return m_config;
        }

        // Validates, loads the library at the configured path, runs native init.
        [[nodiscard]] RecorderError Init(PvRecorder& outRecorder) const;

        // Validates, then runs native init against an already resolved library
        // (in-process entry points). library is consumed only if validation passes.
        [[nodiscard]] RecorderError Init(RecorderLibrary&& library, PvRecorder& outRecorder) const;

        // Device names from the library at the configured path.
        [[nodiscard]] RecorderError GetAvailableDevices(std::vector<std::string>& outDevices) const;

    private:
        [[nodiscard]] RecorderSessionDesc MakeSessionDesc() const noexcept;

        RecorderConfig m_config{};
    };

} // namespace pvr::recorder
