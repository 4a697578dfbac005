// ============================================================================
// PvRecorder - Source/Core/Recorder/RecorderSession.hpp
// ----------------------------------------------------------------------------
// Purpose : Owns one native recorder handle together with the entry-point table
//           and the library mapping it came from, plus the properties cached at
//           creation (frame length, sample rate, selected device, version).
// Contract: Created only through Create(); never copied or moved, always held
//           by std::shared_ptr. The native handle is non-null for the whole
//           life of a published session and pv_recorder_delete runs exactly
//           once, from the destructor (the shared_ptr's last owner), before
//           the library is unmapped.
//           All calls are forwarded on the calling thread; the native layer is
//           thread-safe per handle, so a session may be used concurrently.
// Notes   : No ordering is guaranteed between concurrent ReadInto() calls.
//           Stop() concurrent with an in-flight read is left to the native
//           layer. buffered_frames_count is passed to native init and not kept.
// ============================================================================

#pragma once

#include "Core/Interop/RecorderEntryPoints.hpp"
#include "Core/Recorder/RecorderError.hpp"

#include <memory>
#include <span>
#include <string>

namespace pvr::recorder
{
    struct RecorderSessionDesc
    {
        i32 frameLength = 0;
        i32 deviceIndex = -1;
        i32 bufferedFramesCount = 0;
    };

    class RecorderSession
    {
        // Restricts construction to Create() while still allowing make_shared.
        struct ConstructionKey
        {
            explicit ConstructionKey() = default;
        };

    public:
        static constexpr ThreadSafetyMode kThreadSafety = ThreadSafetyMode::ThreadSafe;

        RecorderSession(ConstructionKey, RecorderLibrary&& library) noexcept;
        ~RecorderSession() noexcept;

        RecorderSession(const RecorderSession&) = delete;
        RecorderSession& operator=(const RecorderSession&) = delete;
        RecorderSession(RecorderSession&&) = delete;
        RecorderSession& operator=(RecorderSession&&) = delete;

        // Purpose : Run native init against an already resolved library and
        //           cache the immutable properties.
        // Contract: desc is assumed validated by the caller. library is
        //           consumed on every path; on failure nothing stays alive
        //           (a handle obtained before a later failure is deleted).
        [[nodiscard]] static RecorderError Create(const RecorderSessionDesc& desc,
                                                  RecorderLibrary&& library,
                                                  std::shared_ptr<RecorderSession>& outSession);

        // Purpose : Same as above, loading the library at libraryPath first.
        [[nodiscard]] static RecorderError Create(const RecorderSessionDesc& desc,
                                                  const char* libraryPath,
                                                  std::shared_ptr<RecorderSession>& outSession);

        [[nodiscard]] RecorderError Start() noexcept;
        [[nodiscard]] RecorderError Stop() noexcept;

        // Blocks until a full frame is available or the native layer fails.
        // buffer.size() < GetFrameLength() is a contract violation (aborts).
        [[nodiscard]] RecorderError ReadInto(std::span<Sample> buffer) noexcept;

        void SetDebugLogging(bool isDebugLoggingEnabled) noexcept;
        [[nodiscard]] bool IsRecording() const noexcept;

        [[nodiscard]] u32 GetFrameLength() const noexcept { return m_frameLength; }
        [[nodiscard]] u32 GetSampleRate() const noexcept { return m_sampleRate; }
        [[nodiscard]] const std::string& GetSelectedDevice() const noexcept { return m_selectedDevice; }
        [[nodiscard]] const std::string& GetVersion() const noexcept { return m_version; }

    private:
        // Declaration order matters: m_library is destroyed last.
        RecorderLibrary   m_library;
        pv_recorder_t*    m_handle = nullptr;
        u32               m_frameLength = 0;
        u32               m_sampleRate = 0;
        std::string       m_selectedDevice;
        std::string       m_version;
    };

} // namespace pvr::recorder
