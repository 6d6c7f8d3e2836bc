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
#include <fstream>
#include <iterator>

using labxfer::IdentityMatch;
using labxfer::IntegrityVerifier;
using labxfer::VerifyOutcome;

namespace {

std::string read_all(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_verify");
    auto local = dir / "sample.raw";
    labxfer_test::write_file(local, 20000, 's');
    const std::string content = read_all(local);
    const std::string digest = labxfer::ChecksumCache::computeDigest(local.string()).digest;
    assert(digest.size() == 64);
    labxfer::PipelineConfig config;

    assert(IntegrityVerifier::cleanIdentifier("W/\"ABCDEF\"") == "abcdef");
    assert(IntegrityVerifier::cleanIdentifier(digest + "  sample.raw\n") == digest);
    assert(IntegrityVerifier::compareIdentifier(digest, digest) == IdentityMatch::Equal);
    assert(IntegrityVerifier::compareIdentifier("\"" + std::string(64, 'a') + "\"", digest) ==
           IdentityMatch::Different);
    assert(IntegrityVerifier::compareIdentifier(std::string(32, 'a'), digest) ==
           IdentityMatch::Inconclusive);
    assert(IntegrityVerifier::compareIdentifier("", digest) == IdentityMatch::Inconclusive);

    // Matching sidecar proves identity
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = content;
        store.files["/lab/sample.raw.checksum"] = digest + "\n";
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::Verified);
        assert(result.ok());
        assert(result.reason.find("stored checksum") != std::string::npos);
        assert(store.get_range_count == 0);
    }

    // An ETag carrying the digest works without a sidecar
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = content;
        store.etags["/lab/sample.raw"] = "W/\"" + digest + "\"";
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::Verified);
        assert(result.reason.find("ETag") != std::string::npos);
    }

    // A comparable ETag outranks a sidecar that repeats the local digest
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = std::string(content.size(), 'w');
        store.files["/lab/sample.raw.checksum"] = digest;
        store.etags["/lab/sample.raw"] = "\"" + std::string(64, 'c') + "\"";
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::Divergent);
        assert(result.reason.find("ETag") != std::string::npos);
        assert(result.remoteIdentifier == std::string(64, 'c'));
    }

    // A 32 character identifier is not comparable with a 64 character digest:
    // fall back to the accessibility check instead of failing
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = content;
        store.etags["/lab/sample.raw"] = "\"" + std::string(32, 'e') + "\"";
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::Accessible);
        assert(result.ok());
        assert(result.reason.find("content not compared") != std::string::npos);
        assert(store.get_range_count == 1);
    }

    // Same length, different value: divergence, not failure
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = content;
        store.files["/lab/sample.raw.checksum"] = std::string(64, '0');
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::Divergent);
        assert(!result.ok());
        assert(result.remoteIdentifier == std::string(64, '0'));
        labxfer::ConflictResolver resolver(labxfer::ConflictPolicy::AlwaysSkip);
        assert(resolver.resolve(local.string(), digest, result.remoteIdentifier) ==
               labxfer::ConflictAction::Skip);
    }

    // Size mismatch stops before any identity or content request
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = content.substr(0, 100);
        IntegrityVerifier verifier(store, config);
        auto result = verifier.verify(local.string(), "/lab/sample.raw", digest);
        assert(result.outcome == VerifyOutcome::SizeMismatch);
        assert(result.reason.find("size mismatch") != std::string::npos);
        assert(store.get_range_count == 0);
    }

    // Missing remote, failed stat, missing local
    {
        labxfer_test::FakeRemoteStore store;
        IntegrityVerifier verifier(store, config);
        assert(verifier.verify(local.string(), "/lab/none.raw", digest).outcome == VerifyOutcome::Failed);
        store.fail_stat = true;
        assert(verifier.verify(local.string(), "/lab/none.raw", digest).outcome == VerifyOutcome::Failed);
        assert(verifier.verify((dir / "gone.raw").string(), "/lab/none.raw", digest).outcome ==
               VerifyOutcome::Failed);
    }

    // Pre-upload comparison
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = "short";
        IntegrityVerifier verifier(store, config);
        auto info = store.stat("/lab/sample.raw");
        auto different = verifier.compareExisting(local.string(), "/lab/sample.raw", digest, *info);
        assert(different.outcome == VerifyOutcome::Divergent);

        store.files["/lab/sample.raw"] = content;
        info = store.stat("/lab/sample.raw");
        auto unknown = verifier.compareExisting(local.string(), "/lab/sample.raw", digest, *info);
        assert(unknown.outcome == VerifyOutcome::Accessible);
        assert(store.get_range_count == 0);
    }

    // A diverged remote copy with AlwaysSkip is left alone and not re-uploaded
    {
        labxfer_test::FakeRemoteStore store;
        store.files["/lab/sample.raw"] = std::string(content.size(), 'z');
        store.files["/lab/sample.raw.checksum"] = std::string(64, 'f');
        config.conflictPolicy = labxfer::ConflictPolicy::AlwaysSkip;
        labxfer::ChecksumCache cache((dir / "cache.json").string());
        labxfer::UploadHistoryStore history((dir / "history.db").string());
        assert(history.open());
        labxfer::StatusChannel channel;
        labxfer::LockedAccessRetrier retrier(config.lockRetry);
        labxfer::ConflictResolver resolver(config.conflictPolicy);
        labxfer::UploadEngine engine(store, cache, config);
        IntegrityVerifier verifier(store, config);
        labxfer::SyncWorker worker(store, cache, engine, verifier, resolver, history, retrier, channel);

        labxfer::QueueItem item{local.string(), "/lab/sample.raw", labxfer::QueueStatus::Processing,
                                std::nullopt};
        auto result = worker.process(item);
        assert(result.outcome == labxfer::ProcessOutcome::Complete);
        assert(store.put_attempts == 0);
        assert(store.content_of("/lab/sample.raw") == std::string(content.size(), 'z'));
        bool skipped = false;
        for (const auto &event : channel.drain())
            skipped |= event.type == labxfer::StatusType::Skipped;
        assert(skipped);

        // The decision is kept, so the same content is not offered again
        auto kept = history.find(local.string());
        assert(kept);
        assert(kept->outcome == labxfer::UploadHistoryStore::kKeptRemote);
        assert(kept->destination == "/lab/sample.raw");
        assert(history.isUnchanged(local.string(), "/lab/sample.raw", cache));
        int stats_before = store.stat_count;
        assert(worker.process(item).outcome == labxfer::ProcessOutcome::Complete);
        assert(store.stat_count == stats_before);
        assert(store.put_attempts == 0);

        // Identical remote content completes without uploading and is recorded
        assert(history.forget(local.string()));
        assert(!history.find(local.string()));
        store.files["/lab/sample.raw"] = content;
        store.files["/lab/sample.raw.checksum"] = digest;
        assert(worker.process(item).outcome == labxfer::ProcessOutcome::Complete);
        assert(store.put_attempts == 0);
        assert(history.find(local.string()));
        assert(history.find(local.string())->outcome == labxfer::UploadHistoryStore::kUploaded);
        history.close();
    }

    fs::remove_all(dir);
    return 0;
}
