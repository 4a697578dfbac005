// Must abort: reading into a buffer shorter than frame_length is a contract
// violation, not a recoverable error. Registered with WILL_FAIL; SIGABRT is
// turned into a plain non-zero exit so the test driver sees a failure code
// rather than a crash.
//
// Every other way out exits 0 so WILL_FAIL reports it: a setup failure, an
// abort raised after the native read already ran, or no abort at all.
#include "Core/Recorder/PvRecorder.hpp"

#include "Fakes/FakeRecorderNative.hpp"

#include <csignal>
#include <cstdlib>
#include <utility>
#include <vector>

static std::filesystem::path UnusedLibraryPath()
{
    return {};
}

extern "C" void OnAbort(int)
{
    // The contract must fire before the native read is reached.
    std::_Exit(pvr::testing::FakeState().readCalls.load() == 0 ? EXIT_FAILURE : 0);
}

int main()
{
    using namespace pvr::recorder;

    pvr::testing::ResetFakeState();

    pvr::RecorderLibrary library;
    if (!pvr::RecorderLibrary::FromEntryPoints(pvr::testing::MakeFakeEntryPoints(), library).IsOk())
    {
        return 0;
    }

    PvRecorder recorder;
    if (!PvRecorderBuilder(512, &UnusedLibraryPath).Init(std::move(library), recorder).IsOk() ||
        !recorder.Start().IsOk())
    {
        return 0;
    }

    if (pvr::testing::FakeState().readCalls.load() != 0)
    {
        return 0;
    }

    // Only the undersized read below may abort.
    std::signal(SIGABRT, &OnAbort);

    std::vector<pvr::Sample> shortBuffer(100, pvr::Sample{ 0 });
    static_cast<void>(recorder.ReadInto(shortBuffer));

    // Reaching this point means the violation went unnoticed.
    return 0;
}
