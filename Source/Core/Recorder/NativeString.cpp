// ============================================================================
// PvRecorder - Source/Core/Recorder/NativeString.cpp
// ============================================================================

#include "Core/Recorder/NativeString.hpp"

#include "Core/Logger.hpp"
#include "Core/Text/Utf8.hpp"

#include <cstring>
#include <string_view>

namespace pvr::recorder
{
RecorderError CopyNativeString(const char* nativeString, const char* context, std::string& out)
{
    if (nativeString == nullptr)
    {
        PVR_LOG_ERROR("Recorder", "native layer returned a null {} string", context);
        return MakeRecorderError(RecorderErrorKind::InternalError,
            "pvrecorder library returned a null {} string", context);
    }

    const std::string_view view(nativeString, std::strlen(nativeString));
    if (!text::IsValidUtf8(view))
    {
        PVR_LOG_ERROR("Recorder", "{} string is not valid UTF-8 ({} bytes)", context, view.size());
        return MakeRecorderError(RecorderErrorKind::StringEncodingError,
            "Failed to convert {} string", context);
    }

    out.assign(view);
    return RecorderOk();
}
} // namespace pvr::recorder
