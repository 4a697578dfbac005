// ============================================================================
// PvRecorder - Core/Interop/SharedLibrary.hpp
// ----------------------------------------------------------------------------
// Purpose : Minimal cross-platform owner of one dynamically loaded library.
// Contract: No exceptions; move-only; the mapping is released exactly once,
//           by Unload() or the destructor. Failures are reported through an
//           ASCII message buffer owned by the caller.
// Notes   : Dynamic loading is slow/cold-path. Symbols obtained through
//           ResolveSymbol() are valid only while this object stays loaded.
//           Thread-safety is caller-managed.
// ============================================================================
#ifndef PVR_INTEROP_SHARED_LIBRARY_HPP
#define PVR_INTEROP_SHARED_LIBRARY_HPP

#include "Core/Types.hpp"

namespace pvr
{

class SharedLibrary
{
public:
    SharedLibrary() noexcept;
    ~SharedLibrary() noexcept;

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    // Purpose : Map the library at path.
    // Contract: path must be non-null; on failure the object stays unloaded and
    //           errorBuffer receives the platform diagnostic (truncated).
    [[nodiscard]] bool Load(const char* path, char* errorBuffer, usize errorCapacity) noexcept;

    // Purpose : Look up an exported symbol by exact name.
    // Contract: Returns nullptr when absent or when not loaded; errorBuffer
    //           receives the platform diagnostic on failure.
    [[nodiscard]] void* ResolveSymbol(const char* name, char* errorBuffer, usize errorCapacity) const noexcept;

    // Purpose : Release the mapping.
    // Contract: Safe to call multiple times; no throw.
    void Unload() noexcept;

    [[nodiscard]] bool IsLoaded() const noexcept
    {
        return m_handle != nullptr;
    }

private:
    void* m_handle;
};

} // namespace pvr

#endif // PVR_INTEROP_SHARED_LIBRARY_HPP
