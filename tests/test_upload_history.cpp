#include "ChecksumCache.hpp"
#include "FakeRemoteStore.hpp"
#include "UploadHistoryStore.hpp"

#include <cassert>
#include <filesystem>

using labxfer::UploadHistoryStore;

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_history");
    auto db = (dir / "upload_history.db").string();
    auto file = (dir / "run.raw").string();
    labxfer_test::write_file(file, 2048);
    labxfer::ChecksumCache cache((dir / "cache.json").string());
    auto digest = cache.digest(file).digest;

    {
        UploadHistoryStore history(db);
        assert(history.open());
        assert(history.size() == 0);
        assert(!history.isUnchanged(file, "/lab/run.raw", cache));

        assert(history.record(file, "/lab/run.raw", digest, 2048));
        assert(history.dirtyCount() == 0);
        auto rec = history.find(file);
        assert(rec);
        assert(rec->remotePath == "/lab/run.raw");
        assert(rec->digest == digest);
        assert(rec->size == 2048);
        assert(rec->uploadedAt > 0);

        assert(history.isUnchanged(file, "/lab/run.raw", cache));
        assert(!history.isUnchanged(file, "/lab/other/run.raw", cache));

        // Cache-only checks never hash
        labxfer::ChecksumCache cold((dir / "cold.json").string());
        assert(history.isUnchanged(file, "/lab/run.raw", cache, false));
        assert(!history.isUnchanged(file, "/lab/run.raw", cold, false));
        assert(cold.size() == 0);
        assert(history.isUnchanged(file, "/lab/run.raw", cold));
        assert(cold.size() == 1);

        // Re-recording overwrites the entry for the same local path
        assert(history.record(file, "/lab/run.raw", digest, 2048));
        assert(history.size() == 1);
        assert(history.flush());
        history.close();
    }

    // Destination and outcome are stored with the record
    {
        auto other = (dir / "other.raw").string();
        labxfer_test::write_file(other, 100, 'o');
        auto otherDigest = cache.digest(other).digest;
        UploadHistoryStore history(db);
        assert(history.open());
        assert(history.record(other, "/lab/conflict_1700000000_other.raw", otherDigest, 100,
                              "/lab/other.raw", UploadHistoryStore::kRenamed));
        auto rec = history.find(other);
        assert(rec);
        assert(rec->destination == "/lab/other.raw");
        assert(rec->outcome == UploadHistoryStore::kRenamed);
        assert(history.isUnchanged(other, "/lab/other.raw", cache));
        assert(!history.isUnchanged(other, "/lab/conflict_1700000000_other.raw", cache));
        history.close();

        // Reloaded from disk, then forgotten there too
        UploadHistoryStore reopened(db);
        assert(reopened.open());
        rec = reopened.find(other);
        assert(rec && rec->destination == "/lab/other.raw");
        assert(rec->outcome == UploadHistoryStore::kRenamed);
        assert(reopened.find(file)->destination == "/lab/run.raw");
        assert(reopened.find(file)->outcome == UploadHistoryStore::kUploaded);
        assert(reopened.forget(other));
        assert(!reopened.find(other));
        reopened.close();

        UploadHistoryStore again(db);
        assert(again.open());
        assert(!again.find(other));
        assert(again.size() == 1);
        again.close();
        fs::remove(other);
    }

    // Records survive a restart
    {
        UploadHistoryStore history(db);
        assert(history.open());
        assert(history.size() == 1);
        assert(history.all().front().localPath == file);
        assert(history.isUnchanged(file, "/lab/run.raw", cache));

        // Same size, different content
        labxfer_test::write_file(file, 2048, 'z');
        fs::last_write_time(file, fs::last_write_time(file) + std::chrono::seconds(5));
        assert(!history.isUnchanged(file, "/lab/run.raw", cache));
        // Different size
        labxfer_test::append_file(file, 1);
        assert(!history.isUnchanged(file, "/lab/run.raw", cache));
        fs::remove(file);
        assert(!history.isUnchanged(file, "/lab/run.raw", cache));
        history.close();
    }

    fs::remove_all(dir);
    return 0;
}
