#include "ChecksumCache.hpp"
#include "Config.hpp"
#include "FakeRemoteStore.hpp"
#include "StabilityTracker.hpp"
#include "TransferQueue.hpp"
#include "UploadEngine.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <thread>
#include <vector>

using labxfer::Clock;
using std::chrono::milliseconds;
using std::chrono::seconds;

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_stability");
    auto file = (dir / "run.raw").generic_string();
    labxfer_test::write_file(file, 100);

    // Ready exactly once after the window
    {
        std::vector<std::string> ready;
        labxfer::StabilityTracker tracker(milliseconds(1000), milliseconds(250),
                                          [&](const std::string &path) { ready.push_back(path); });
        auto t0 = Clock::now();
        tracker.observe(file, t0);
        assert(tracker.isPending(file));
        assert(tracker.tick(t0 + milliseconds(500)) == 0);
        assert(tracker.tick(t0 + milliseconds(1000)) == 1);
        assert(ready.size() == 1 && ready[0] == file);
        assert(!tracker.isPending(file));
        assert(tracker.tick(t0 + milliseconds(5000)) == 0);
        assert(ready.size() == 1);

        // Repeated notifications do not reset an unchanged file
        tracker.observe(file, t0);
        tracker.observe(file, t0 + milliseconds(900));
        assert(tracker.pendingCount() == 1);
        assert(tracker.tick(t0 + milliseconds(1000)) == 1);
        assert(ready.size() == 2);
    }

    // A file that vanishes is dropped without a callback
    {
        int calls = 0;
        labxfer::StabilityTracker tracker(milliseconds(100), milliseconds(10),
                                          [&](const std::string &) { ++calls; });
        auto gone = dir / "gone.raw";
        labxfer_test::write_file(gone, 10);
        auto t0 = Clock::now();
        tracker.observe(gone.generic_string(), t0);
        fs::remove(gone);
        assert(tracker.tick(t0 + seconds(1)) == 0);
        assert(tracker.pendingCount() == 0);
        assert(calls == 0);
        tracker.observe((dir / "never.raw").generic_string(), t0);
        assert(tracker.pendingCount() == 0);
    }

    // Two writes 2 s apart: nothing is admitted until a full window after
    // the second write, and the file uploads once
    {
        labxfer_test::FakeRemoteStore store;
        labxfer::PipelineConfig config;
        labxfer::ChecksumCache cache((dir / "cache.json").string());
        labxfer::UploadEngine engine(store, cache, config);
        labxfer::TransferQueue queue;
        queue.setProcessor([&](const labxfer::QueueItem &item) {
            auto result = engine.upload(item.localPath, item.remotePath, nullptr);
            return labxfer::ProcessResult{result.status == labxfer::UploadStatus::Ok
                                              ? labxfer::ProcessOutcome::Complete
                                              : labxfer::ProcessOutcome::Failed,
                                          result.reason};
        });

        const milliseconds window(3000);
        labxfer::StabilityTracker tracker(window, milliseconds(250), [&](const std::string &path) {
            queue.admit(path, "/lab/burst.raw");
        });

        auto burst = (dir / "burst.raw").generic_string();
        const std::size_t half = 5 * 1024 * 1024 / 2;
        auto t0 = Clock::now();
        labxfer_test::write_file(burst, half);
        tracker.observe(burst, t0);
        assert(tracker.tick(t0 + seconds(1)) == 0);

        labxfer_test::append_file(burst, half);
        auto t_second = t0 + seconds(2);
        tracker.observe(burst, t_second);
        for (auto t = t_second; t < t_second + window; t += milliseconds(250)) {
            tracker.tick(t);
            assert(queue.queuedCount() == 0);
        }
        assert(tracker.tick(t_second + window) == 1);
        assert(queue.queuedCount() == 1);

        assert(queue.processNext());
        assert(!queue.processNext());
        assert(store.uploads_of("/lab/burst.raw") == 1);
        assert(store.content_of("/lab/burst.raw").size() == 2 * half);
        assert(queue.status(burst) == labxfer::QueueStatus::Complete);
    }

    // The tick thread drives readiness on its own
    {
        std::atomic<int> calls{0};
        labxfer::StabilityTracker tracker(milliseconds(100), milliseconds(20),
                                          [&](const std::string &) { ++calls; });
        tracker.start();
        tracker.observe(file);
        for (int i = 0; i < 100 && calls.load() == 0; ++i)
            std::this_thread::sleep_for(milliseconds(20));
        tracker.stop();
        assert(calls.load() == 1);
    }

    fs::remove_all(dir);
    return 0;
}
