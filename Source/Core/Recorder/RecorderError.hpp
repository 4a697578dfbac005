// ============================================================================
// PvRecorder - Source/Core/Recorder/RecorderError.hpp
// ----------------------------------------------------------------------------
// Purpose : Single categorized error value for every fallible recorder call:
//           native status codes, library load failures, argument validation
//           and string decoding failures.
// Contract: RecorderError is trivially copyable (fixed-capacity message, no
//           allocations). A default-constructed value means success. Messages
//           are truncated to kRecorderErrorMessageCapacity - 1 bytes.
// Notes   : NativeStatus values are the native library's integers verbatim.
//           Unknown integers are preserved as-is and print as "UNKNOWN".
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>

namespace pvr::recorder
{
    enum class NativeStatus : i32
    {
        Success = 0,
        OutOfMemory = 1,
        InvalidArgument = 2,
        InvalidState = 3,
        BackendError = 4,
        DeviceAlreadyInitialized = 5,
        DeviceNotInitialized = 6,
        IoError = 7,
        RuntimeError = 8
    };

    enum class RecorderErrorKind : u8
    {
        None = 0,
        NativeStatus,        // Native entry point returned a non-success status.
        LibraryLoadFailure,  // Library missing/unmappable or a symbol absent.
        ArgumentError,       // Configuration rejected before any native call.
        StringEncodingError, // Native string was not valid UTF-8.
        InternalError        // Native layer broke its own contract.
    };

    inline constexpr usize kRecorderErrorMessageCapacity = 256;

    struct RecorderError
    {
        RecorderErrorKind kind = RecorderErrorKind::None;
        NativeStatus      nativeStatus = NativeStatus::Success;
        char              message[kRecorderErrorMessageCapacity]{};

        [[nodiscard]] constexpr bool IsOk() const noexcept
        {
            return kind == RecorderErrorKind::None;
        }

        // True when the native layer reported exactly this status.
        [[nodiscard]] constexpr bool Is(NativeStatus status) const noexcept
        {
            return kind == RecorderErrorKind::NativeStatus && nativeStatus == status;
        }

        [[nodiscard]] std::string_view Message() const noexcept
        {
            return std::string_view(message);
        }
    };

    static_assert(std::is_trivially_copyable_v<RecorderError>);

    [[nodiscard]] const char* ToString(NativeStatus status) noexcept;
    [[nodiscard]] const char* ToString(RecorderErrorKind kind) noexcept;

    [[nodiscard]] constexpr bool IsKnownNativeStatus(i32 raw) noexcept
    {
        return raw >= static_cast<i32>(NativeStatus::Success) &&
               raw <= static_cast<i32>(NativeStatus::RuntimeError);
    }

    [[nodiscard]] constexpr RecorderError RecorderOk() noexcept
    {
        return RecorderError{};
    }

    template <class... Args>
    [[nodiscard]] RecorderError MakeRecorderError(RecorderErrorKind kind,
                                                  std::format_string<Args...> fmt,
                                                  Args&&... args) noexcept
    {
        RecorderError error{};
        error.kind = kind;
        try
        {
            const auto result = std::format_to_n(error.message, kRecorderErrorMessageCapacity - 1,
                                                 fmt, static_cast<Args&&>(args)...);
            const usize written = static_cast<usize>(std::max<std::ptrdiff_t>(0, result.size));
            error.message[std::min(written, kRecorderErrorMessageCapacity - 1)] = '\0';
        }
        catch (const std::exception&)
        {
            constexpr std::string_view kFallback = "recorder error (message formatting failed)";
            kFallback.copy(error.message, kFallback.size());
            error.message[kFallback.size()] = '\0';
        }
        return error;
    }

    // Maps a raw native status returned by functionName. SUCCESS maps to ok.
    [[nodiscard]] RecorderError CheckNativeStatus(i32 rawStatus, const char* functionName) noexcept;

    // "<message>: <Kind>" or "<message>: NativeStatus(<STATUS>)".
    [[nodiscard]] std::string FormatRecorderError(const RecorderError& error);

} // namespace pvr::recorder
