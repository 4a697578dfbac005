// ============================================================================
// PvRecorder - tests/AllSmokes/AllRecorderSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs every in-process recorder smoke.
// Contract: Deterministic ordering; prints the failing code of each smoke;
//           returns 0 on success.
// Notes   : Run*Smoke helpers are linked from their respective TUs. The
//           dynamic-load path is covered by RecorderModuleSmoke.
// ============================================================================

#include "Core/Logger.hpp"

#include <print>

int RunLoggerSmoke();
int RunRecorderErrorSmoke();
int RunLibraryPathSmoke();
int RunRecorderConfigSmoke();
int RunRecorderSessionSmoke();
int RunDeviceEnumeratorSmoke();
int RunRecorderThreadsSmoke();

namespace
{
    int Report(const char* name, int code)
    {
        if (code != 0)
        {
            std::println("{} failed with code {}", name, code);
            return 1;
        }
        return 0;
    }
} // namespace

int main()
{
    pvr::core::Logger::ConfigureFromEnvironment();

    int failures = 0;

    failures += Report("Logger", RunLoggerSmoke());
    failures += Report("RecorderError", RunRecorderErrorSmoke());
    failures += Report("LibraryPath", RunLibraryPathSmoke());
    failures += Report("RecorderConfig", RunRecorderConfigSmoke());
    failures += Report("RecorderSession", RunRecorderSessionSmoke());
    failures += Report("DeviceEnumerator", RunDeviceEnumeratorSmoke());
    failures += Report("RecorderThreads", RunRecorderThreadsSmoke());

    return (failures == 0) ? 0 : 1;
}
