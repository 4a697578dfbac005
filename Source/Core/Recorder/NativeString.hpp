// ============================================================================
// PvRecorder - Source/Core/Recorder/NativeString.hpp
// ----------------------------------------------------------------------------
// Purpose : Copy a NUL-terminated string owned by the native layer into an
//           owned, UTF-8 validated std::string.
// Contract: Never reads past the terminator; the native pointer is not kept.
//           Null pointer -> InternalError, invalid UTF-8 -> StringEncodingError.
//           out is only written on success.
// ============================================================================

#pragma once

#include "Core/Recorder/RecorderError.hpp"

#include <string>

namespace pvr::recorder
{
    // context names the value for the error message ("selected device", ...).
    [[nodiscard]] RecorderError CopyNativeString(const char* nativeString, const char* context, std::string& out);
} // namespace pvr::recorder
