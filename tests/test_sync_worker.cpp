#include "ChecksumCache.hpp"
#include "ConflictResolver.hpp"
#include "FakeRemoteStore.hpp"
#include "IntegrityVerifier.hpp"
#include "LockedAccessRetrier.hpp"
#include "StatusChannel.hpp"
#include "SyncWorker.hpp"
#include "UploadEngine.hpp"
#include "UploadHistoryStore.hpp"

#include <cassert>
#include <filesystem>
#include <memory>
#include <string>

using labxfer::ConflictAction;
using labxfer::ProcessOutcome;
using labxfer::QueueItem;
using labxfer::QueueStatus;
using labxfer::StatusType;
using labxfer::UploadHistoryStore;

namespace {

std::filesystem::path prepared(const std::filesystem::path &dir) {
    std::filesystem::create_directories(dir);
    return dir;
}

// Worker with every collaborator it needs, backed by a fake store.
struct WorkerFixture {
    explicit WorkerFixture(const std::filesystem::path &dir,
                           labxfer::ConflictPolicy policy = labxfer::ConflictPolicy::AskExternal)
        : cache((prepared(dir) / "cache.json").string()), history((dir / "history.db").string()),
          retrier(config.lockRetry), resolver(policy), engine(store, cache, config),
          verifier(store, config),
          worker(store, cache, engine, verifier, resolver, history, retrier, channel) {
        assert(history.open());
    }

    bool saw(StatusType type) {
        bool found = false;
        for (const auto &event : channel.drain())
            found |= event.type == type;
        return found;
    }

    labxfer::PipelineConfig config;
    labxfer_test::FakeRemoteStore store;
    labxfer::ChecksumCache cache;
    UploadHistoryStore history;
    labxfer::StatusChannel channel;
    labxfer::LockedAccessRetrier retrier;
    labxfer::ConflictResolver resolver;
    labxfer::UploadEngine engine;
    labxfer::IntegrityVerifier verifier;
    labxfer::SyncWorker worker;
};

QueueItem itemFor(const std::filesystem::path &local, const std::string &remote) {
    return QueueItem{local.string(), remote, QueueStatus::Processing, std::nullopt};
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_worker");

    // A file that grows while it is being uploaded goes back to stability
    // tracking and nothing is recorded
    {
        auto local = dir / "growing.raw";
        labxfer_test::write_file(local, 4096);
        WorkerFixture fx(dir / "growing");
        int appended = 0;
        fx.store.on_put = [&](const std::string &) {
            if (appended++ == 0)
                labxfer_test::append_file(local, 512);
        };
        auto result = fx.worker.process(itemFor(local, "/lab/growing.raw"));
        assert(result.outcome == ProcessOutcome::Requeue);
        assert(!fx.history.find(local.string()));
        assert(fx.store.sidecar_puts == 0);
        assert(fx.saw(StatusType::LockWait));

        // The settled file uploads normally next time
        result = fx.worker.process(itemFor(local, "/lab/growing.raw"));
        assert(result.outcome == ProcessOutcome::Complete);
        assert(fx.store.content_of("/lab/growing.raw").size() == 4096 + 512);
        assert(fx.history.find(local.string()));
        fx.history.close();
    }

    // An external decision also answers a divergence found after the upload,
    // and it does not outlive the item
    {
        auto local = dir / "decided.raw";
        labxfer_test::write_file(local, 2048, 'd');
        WorkerFixture fx(dir / "decided");
        fx.store.files["/lab/decided.raw"] = std::string(100, 'r');
        // The server reports an ETag that never matches what was sent
        fx.store.etags["/lab/decided.raw"] = "\"" + std::string(64, 'c') + "\"";

        auto result = fx.worker.process(itemFor(local, "/lab/decided.raw"));
        assert(result.outcome == ProcessOutcome::Suspended);
        assert(fx.store.uploads_of("/lab/decided.raw") == 0);
        assert(fx.saw(StatusType::ConflictPending));

        QueueItem resumed = itemFor(local, "/lab/decided.raw");
        resumed.resolution = ConflictAction::UploadOverwrite;
        result = fx.worker.process(resumed);
        assert(result.outcome == ProcessOutcome::Failed);
        assert(fx.store.uploads_of("/lab/decided.raw") == 2);
        assert(!fx.saw(StatusType::ConflictPending));
        assert(!fx.history.find(local.string()));

        auto digest = labxfer::ChecksumCache::computeDigest(local.string()).digest;
        assert(fx.resolver.resolve(local.string(), digest, std::string(64, 'c')) ==
               ConflictAction::DeferToExternal);
        fx.history.close();
    }

    // A renamed upload is remembered against the original destination
    {
        auto local = dir / "renamed.raw";
        labxfer_test::write_file(local, 3000, 'n');
        WorkerFixture fx(dir / "renamed");
        fx.store.files["/lab/renamed.raw"] = std::string(3000, 'o');
        fx.store.files["/lab/renamed.raw.checksum"] = std::string(64, 'e');

        QueueItem resumed = itemFor(local, "/lab/renamed.raw");
        resumed.resolution = ConflictAction::RenameAndUpload;
        auto result = fx.worker.process(resumed);
        assert(result.outcome == ProcessOutcome::Complete);
        assert(fx.store.content_of("/lab/renamed.raw") == std::string(3000, 'o'));

        auto record = fx.history.find(local.string());
        assert(record);
        assert(record->outcome == UploadHistoryStore::kRenamed);
        assert(record->destination == "/lab/renamed.raw");
        assert(record->remotePath != "/lab/renamed.raw");
        assert(record->remotePath.find("/lab/conflict_") == 0);
        assert(fx.store.uploads_of(record->remotePath) == 1);
        assert(fx.history.isUnchanged(local.string(), "/lab/renamed.raw", fx.cache));

        // Seen again by the watcher, the file is not renamed a second time
        int puts_before = fx.store.put_attempts;
        result = fx.worker.process(itemFor(local, "/lab/renamed.raw"));
        assert(result.outcome == ProcessOutcome::Complete);
        assert(fx.store.put_attempts == puts_before);
        assert(fx.saw(StatusType::Skipped));
        fx.history.close();
    }

    // An unchanged, already uploaded file is skipped before touching the server
    {
        auto local = dir / "done.raw";
        labxfer_test::write_file(local, 1500, 'u');
        WorkerFixture fx(dir / "done");
        assert(fx.worker.process(itemFor(local, "/lab/done.raw")).outcome == ProcessOutcome::Complete);
        assert(fx.store.uploads_of("/lab/done.raw") == 1);
        fx.channel.drain();

        int stats_before = fx.store.stat_count;
        auto result = fx.worker.process(itemFor(local, "/lab/done.raw"));
        assert(result.outcome == ProcessOutcome::Complete);
        assert(fx.store.stat_count == stats_before);
        assert(fx.store.uploads_of("/lab/done.raw") == 1);
        assert(fx.saw(StatusType::Skipped));

        // A local change is new work
        labxfer_test::append_file(local, 10);
        result = fx.worker.process(itemFor(local, "/lab/done.raw"));
        assert(result.outcome == ProcessOutcome::Complete);
        assert(fx.store.uploads_of("/lab/done.raw") == 2);
        fx.history.close();
    }

    fs::remove_all(dir);
    return 0;
}
