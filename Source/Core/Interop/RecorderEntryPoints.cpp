// ============================================================================
// PvRecorder - Core/Interop/RecorderEntryPoints.cpp
// ----------------------------------------------------------------------------
// Purpose : Atomic resolution of the native recorder entry-point table.
// Contract: No exceptions; a failed load never publishes a partial table and
//           never leaves the library mapped.
// Notes   : Symbols are resolved into a local table and a local SharedLibrary;
//           both are moved into the output only after the last lookup.
// ============================================================================
#include "Core/Interop/RecorderEntryPoints.hpp"

#include "Core/Logger.hpp"

#include <utility>

namespace pvr
{
namespace
{
    constexpr usize kLoaderMessageCapacity = 192;

    template <typename Fn>
    [[nodiscard]] bool ResolveEntryPoint(const SharedLibrary& library,
                                         const char* name,
                                         Fn& outFn,
                                         char* errorBuffer,
                                         usize errorCapacity) noexcept
    {
        void* sym = library.ResolveSymbol(name, errorBuffer, errorCapacity);
        if (!sym)
        {
            return false;
        }

        // Object-to-function pointer conversion is conditionally supported;
        // every platform that can dlsym/GetProcAddress supports it.
        outFn = reinterpret_cast<Fn>(sym);
        return true;
    }
} // namespace

#define PVR_RESOLVE_ENTRY_POINT(field, symbolName)                                                   \
    if (!ResolveEntryPoint(library, symbolName, table.field, detail, sizeof(detail)))                \
    {                                                                                                \
        PVR_LOG_ERROR("Loader", "missing entry point '{}' in '{}': {}", symbolName, path, detail);   \
        return recorder::MakeRecorderError(recorder::RecorderErrorKind::LibraryLoadFailure,           \
            "Failed to load function symbol '{}' from pvrecorder library: {}", symbolName, detail);  \
    }

const char* FindMissingEntryPoint(const RecorderEntryPoints& entryPoints) noexcept
{
    if (!entryPoints.init)                 return PV_RECORDER_SYMBOL_INIT;
    if (!entryPoints.destroy)              return PV_RECORDER_SYMBOL_DELETE;
    if (!entryPoints.start)                return PV_RECORDER_SYMBOL_START;
    if (!entryPoints.stop)                 return PV_RECORDER_SYMBOL_STOP;
    if (!entryPoints.read)                 return PV_RECORDER_SYMBOL_READ;
    if (!entryPoints.setDebugLogging)      return PV_RECORDER_SYMBOL_SET_DEBUG_LOGGING;
    if (!entryPoints.getIsRecording)       return PV_RECORDER_SYMBOL_GET_IS_RECORDING;
    if (!entryPoints.getSelectedDevice)    return PV_RECORDER_SYMBOL_GET_SELECTED_DEVICE;
    if (!entryPoints.getAvailableDevices)  return PV_RECORDER_SYMBOL_GET_AVAILABLE_DEVICES;
    if (!entryPoints.freeAvailableDevices) return PV_RECORDER_SYMBOL_FREE_AVAILABLE_DEVICES;
    if (!entryPoints.sampleRate)           return PV_RECORDER_SYMBOL_SAMPLE_RATE;
    if (!entryPoints.version)              return PV_RECORDER_SYMBOL_VERSION;
    return nullptr;
}

RecorderLibrary::RecorderLibrary(RecorderLibrary&& other) noexcept
    : m_library(std::move(other.m_library))
    , m_entryPoints(other.m_entryPoints)
{
    other.m_entryPoints = RecorderEntryPoints{};
}

RecorderLibrary& RecorderLibrary::operator=(RecorderLibrary&& other) noexcept
{
    if (this != &other)
    {
        Reset();
        m_library = std::move(other.m_library);
        m_entryPoints = other.m_entryPoints;
        other.m_entryPoints = RecorderEntryPoints{};
    }
    return *this;
}

void RecorderLibrary::Reset() noexcept
{
    m_entryPoints = RecorderEntryPoints{};
    m_library.Unload();
}

recorder::RecorderError RecorderLibrary::Load(const char* path, RecorderLibrary& out) noexcept
{
    if (!path || path[0] == '\0')
    {
        return recorder::MakeRecorderError(recorder::RecorderErrorKind::LibraryLoadFailure,
            "Failed to load pvrecorder dynamic library: empty path");
    }

    char detail[kLoaderMessageCapacity] = {};
    SharedLibrary library;
    if (!library.Load(path, detail, sizeof(detail)))
    {
        PVR_LOG_ERROR("Loader", "cannot load '{}': {}", path, detail);
        return recorder::MakeRecorderError(recorder::RecorderErrorKind::LibraryLoadFailure,
            "Failed to load pvrecorder dynamic library: {}", detail);
    }

    RecorderEntryPoints table{};
    PVR_RESOLVE_ENTRY_POINT(init,                 PV_RECORDER_SYMBOL_INIT)
    PVR_RESOLVE_ENTRY_POINT(destroy,              PV_RECORDER_SYMBOL_DELETE)
    PVR_RESOLVE_ENTRY_POINT(start,                PV_RECORDER_SYMBOL_START)
    PVR_RESOLVE_ENTRY_POINT(stop,                 PV_RECORDER_SYMBOL_STOP)
    PVR_RESOLVE_ENTRY_POINT(read,                 PV_RECORDER_SYMBOL_READ)
    PVR_RESOLVE_ENTRY_POINT(setDebugLogging,      PV_RECORDER_SYMBOL_SET_DEBUG_LOGGING)
    PVR_RESOLVE_ENTRY_POINT(getIsRecording,       PV_RECORDER_SYMBOL_GET_IS_RECORDING)
    PVR_RESOLVE_ENTRY_POINT(getSelectedDevice,    PV_RECORDER_SYMBOL_GET_SELECTED_DEVICE)
    PVR_RESOLVE_ENTRY_POINT(getAvailableDevices,  PV_RECORDER_SYMBOL_GET_AVAILABLE_DEVICES)
    PVR_RESOLVE_ENTRY_POINT(freeAvailableDevices, PV_RECORDER_SYMBOL_FREE_AVAILABLE_DEVICES)
    PVR_RESOLVE_ENTRY_POINT(sampleRate,           PV_RECORDER_SYMBOL_SAMPLE_RATE)
    PVR_RESOLVE_ENTRY_POINT(version,              PV_RECORDER_SYMBOL_VERSION)

    out.Reset();
    out.m_library = std::move(library);
    out.m_entryPoints = table;
    PVR_LOG_VERBOSE("Loader", "resolved {} entry points from '{}'", kRecorderEntryPointCount, path);
    return recorder::RecorderOk();
}

#undef PVR_RESOLVE_ENTRY_POINT

recorder::RecorderError RecorderLibrary::FromEntryPoints(const RecorderEntryPoints& entryPoints,
                                                         RecorderLibrary& out) noexcept
{
    if (const char* missing = FindMissingEntryPoint(entryPoints))
    {
        PVR_LOG_ERROR("Loader", "in-process entry point table is missing '{}'", missing);
        return recorder::MakeRecorderError(recorder::RecorderErrorKind::LibraryLoadFailure,
            "Entry point table is missing '{}'", missing);
    }

    out.Reset();
    out.m_entryPoints = entryPoints;
    return recorder::RecorderOk();
}

} // namespace pvr
