// ============================================================================
// PvRecorder - Core/Interop/SharedLibrary.cpp
// ----------------------------------------------------------------------------
// Purpose : dlopen/LoadLibrary implementation of SharedLibrary.
// Contract: No exceptions; every failure path leaves the object unloaded and
//           writes a NUL-terminated diagnostic into the caller's buffer.
// Notes   : POSIX uses RTLD_NOW so unresolved native dependencies fail at load
//           time instead of at the first call into the recorder.
// ============================================================================
#include "Core/Interop/SharedLibrary.hpp"

#include "Core/Logger.hpp"
#include "Core/Platform/PlatformDefines.hpp"

#if PVR_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

#include <stdio.h>
#include <string.h>

namespace pvr
{
namespace
{
    static void WriteError(char* buffer, usize capacity, const char* prefix, const char* detail) noexcept
    {
        if (!buffer || capacity == 0u)
        {
            return;
        }

        const int n = ::snprintf(buffer, capacity, "%s: %s", prefix, detail ? detail : "unknown error");
        if (n < 0)
        {
            buffer[0] = '\0';
        }
    }

#if PVR_PLATFORM_WINDOWS
    static void WriteWin32Error(char* buffer, usize capacity, const char* prefix) noexcept
    {
        const DWORD err = ::GetLastError();
        char detail[64];
        const int n = ::snprintf(detail, sizeof(detail), "win32 error %lu", (unsigned long)err);
        if (n < 0)
        {
            detail[0] = '\0';
        }
        WriteError(buffer, capacity, prefix, detail);
    }
#endif
} // namespace

SharedLibrary::SharedLibrary() noexcept
    : m_handle(nullptr)
{
}

SharedLibrary::~SharedLibrary() noexcept
{
    Unload();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : m_handle(other.m_handle)
{
    other.m_handle = nullptr;
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept
{
    if (this != &other)
    {
        Unload();
        m_handle = other.m_handle;
        other.m_handle = nullptr;
    }
    return *this;
}

bool SharedLibrary::Load(const char* path, char* errorBuffer, usize errorCapacity) noexcept
{
    if (!path)
    {
        WriteError(errorBuffer, errorCapacity, "invalid library path", "null");
        return false;
    }

    if (m_handle)
    {
        Unload();
    }

#if PVR_PLATFORM_WINDOWS
    HMODULE lib = ::LoadLibraryA(path);
    if (!lib)
    {
        WriteWin32Error(errorBuffer, errorCapacity, "LoadLibraryA failed");
        return false;
    }
    m_handle = reinterpret_cast<void*>(lib);
#else
    // RTLD_LOCAL keeps the recorder's symbols out of the global namespace.
    void* lib = ::dlopen(path, RTLD_NOW | RTLD_LOCAL);
    if (!lib)
    {
        WriteError(errorBuffer, errorCapacity, "dlopen failed", ::dlerror());
        return false;
    }
    m_handle = lib;
#endif

    PVR_LOG_VERBOSE("Loader", "mapped '{}'", path);
    return true;
}

void* SharedLibrary::ResolveSymbol(const char* name, char* errorBuffer, usize errorCapacity) const noexcept
{
    if (!m_handle || !name)
    {
        WriteError(errorBuffer, errorCapacity, "symbol lookup failed", "library not loaded");
        return nullptr;
    }

#if PVR_PLATFORM_WINDOWS
    FARPROC proc = ::GetProcAddress(static_cast<HMODULE>(m_handle), name);
    if (!proc)
    {
        WriteWin32Error(errorBuffer, errorCapacity, name);
        return nullptr;
    }
    return reinterpret_cast<void*>(proc);
#else
    // Clear any prior error before calling dlsym.
    (void)::dlerror();
    void* sym = ::dlsym(m_handle, name);
    const char* symErr = ::dlerror();
    if (symErr != nullptr)
    {
        WriteError(errorBuffer, errorCapacity, name, symErr);
        return nullptr;
    }
    if (!sym)
    {
        WriteError(errorBuffer, errorCapacity, name, "dlsym returned null");
        return nullptr;
    }
    return sym;
#endif
}

void SharedLibrary::Unload() noexcept
{
    if (!m_handle)
    {
        return;
    }

#if PVR_PLATFORM_WINDOWS
    ::FreeLibrary(static_cast<HMODULE>(m_handle));
#else
    ::dlclose(m_handle);
#endif
    m_handle = nullptr;
    PVR_LOG_VERBOSE("Loader", "library unmapped");
}

} // namespace pvr
