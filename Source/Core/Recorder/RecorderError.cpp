// ============================================================================
// PvRecorder - Source/Core/Recorder/RecorderError.cpp
// ----------------------------------------------------------------------------
// Purpose : Status naming and native status translation.
// Contract: No exceptions escape except std::bad_alloc from FormatRecorderError.
// Notes   : Every non-success native status is logged where it is converted.
// ============================================================================

#include "Core/Recorder/RecorderError.hpp"

#include "Core/Logger.hpp"

namespace pvr::recorder
{
const char* ToString(NativeStatus status) noexcept
{
    switch (status)
    {
        case NativeStatus::Success:                  return "SUCCESS";
        case NativeStatus::OutOfMemory:              return "OUT_OF_MEMORY";
        case NativeStatus::InvalidArgument:          return "INVALID_ARGUMENT";
        case NativeStatus::InvalidState:             return "INVALID_STATE";
        case NativeStatus::BackendError:             return "BACKEND_ERROR";
        case NativeStatus::DeviceAlreadyInitialized: return "DEVICE_ALREADY_INITIALIZED";
        case NativeStatus::DeviceNotInitialized:     return "DEVICE_NOT_INITIALIZED";
        case NativeStatus::IoError:                  return "IO_ERROR";
        case NativeStatus::RuntimeError:             return "RUNTIME_ERROR";
        default:                                     return "UNKNOWN";
    }
}

const char* ToString(RecorderErrorKind kind) noexcept
{
    switch (kind)
    {
        case RecorderErrorKind::None:                return "None";
        case RecorderErrorKind::NativeStatus:        return "NativeStatus";
        case RecorderErrorKind::LibraryLoadFailure:  return "LibraryLoadFailure";
        case RecorderErrorKind::ArgumentError:       return "ArgumentError";
        case RecorderErrorKind::StringEncodingError: return "StringEncodingError";
        case RecorderErrorKind::InternalError:       return "InternalError";
        default:                                     return "Unknown";
    }
}

RecorderError CheckNativeStatus(i32 rawStatus, const char* functionName) noexcept
{
    const NativeStatus status = static_cast<NativeStatus>(rawStatus);
    if (status == NativeStatus::Success)
    {
        return RecorderOk();
    }

    const char* name = functionName ? functionName : "<unknown>";
    PVR_LOG_ERROR("Recorder", "'{}' failed with {} ({})", name, ToString(status), rawStatus);

    RecorderError error = MakeRecorderError(RecorderErrorKind::NativeStatus,
        "Function '{}' in the pvrecorder library failed", name);
    error.nativeStatus = status;
    return error;
}

std::string FormatRecorderError(const RecorderError& error)
{
    if (error.kind == RecorderErrorKind::NativeStatus)
    {
        return std::format("{}: NativeStatus({})", error.Message(), ToString(error.nativeStatus));
    }
    return std::format("{}: {}", error.Message(), ToString(error.kind));
}

} // namespace pvr::recorder
