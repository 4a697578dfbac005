#include "Core/Recorder/PvRecorder.hpp"

#include "Fakes/FakeRecorderNative.hpp"

#include <atomic>
#include <utility>
#include <thread>
#include <vector>

namespace
{
    [[nodiscard]] std::filesystem::path UnusedLibraryPath()
    {
        return {};
    }

    static_assert(pvr::recorder::RecorderSession::kThreadSafety == pvr::ThreadSafetyMode::ThreadSafe,
                  "sessions are shared across threads without external locking");

    constexpr int kThreadCount = 8;
    constexpr int kReadsPerThread = 25;
} // namespace

int RunRecorderThreadsSmoke()
{
    using namespace pvr::recorder;
    using pvr::testing::FakeState;
    using pvr::Sample;

    pvr::testing::ResetFakeState();

    for (int round = 0; round < 10; ++round)
    {
        pvr::RecorderLibrary library;
        if (!pvr::RecorderLibrary::FromEntryPoints(pvr::testing::MakeFakeEntryPoints(), library).IsOk())
        {
            return 1;
        }

        PvRecorder recorder;
        if (!PvRecorderBuilder(160, &UnusedLibraryPath).Init(std::move(library), recorder).IsOk() ||
            !recorder.Start().IsOk())
        {
            return 2;
        }

        // Every thread reads through its own copy, then drops it. The last
        // copy to go away, whichever thread holds it, deletes the recorder.
        std::atomic<int> failures{ 0 };
        std::vector<std::thread> threads;
        threads.reserve(kThreadCount);
        for (int t = 0; t < kThreadCount; ++t)
        {
            threads.emplace_back([copy = recorder, &failures]() mutable {
                std::vector<Sample> frame;
                for (int i = 0; i < kReadsPerThread; ++i)
                {
                    if (!copy.Read(frame).IsOk() || frame.size() != 160u)
                    {
                        failures.fetch_add(1);
                    }
                }
                copy = PvRecorder{};
            });
        }

        recorder = PvRecorder{};
        for (std::thread& thread : threads)
        {
            thread.join();
        }

        if (failures.load() != 0)
        {
            return 3;
        }
        if (FakeState().deleteCalls.load() != round + 1 || FakeState().liveHandles.load() != 0)
        {
            return 4;
        }
    }

    if (FakeState().readCalls.load() != 10 * kThreadCount * kReadsPerThread)
    {
        return 5;
    }

    return 0;
}
