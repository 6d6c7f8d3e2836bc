#include "ChecksumCache.hpp"
#include "FakeRemoteStore.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>

using labxfer::AccessStatus;
using labxfer::ChecksumCache;

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_cache");
    auto cache_file = (dir / "state" / "checksum_cache.json").string();

    auto abc = dir / "abc.raw";
    {
        std::ofstream out(abc, std::ios::binary);
        out << "abc";
    }
    const std::string abc_digest =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    {
        ChecksumCache cache(cache_file);
        auto first = cache.digest(abc.string());
        assert(first.ok());
        assert(first.digest == abc_digest);
        assert(cache.hitCount() == 0);
        assert(cache.size() == 1);

        auto second = cache.digest(abc.string());
        assert(second.ok() && second.digest == abc_digest);
        assert(cache.hitCount() == 1);

        // A multi-block file is served from the cache on the second call
        auto big = dir / "big.raw";
        labxfer_test::write_file(big, 3 * ChecksumCache::kBlockSize + 17, 'q');
        auto start = std::chrono::steady_clock::now();
        auto cold = cache.digest(big.string());
        auto cold_time = std::chrono::steady_clock::now() - start;
        start = std::chrono::steady_clock::now();
        auto warm = cache.digest(big.string());
        auto warm_time = std::chrono::steady_clock::now() - start;
        assert(cold.ok() && warm.ok() && cold.digest == warm.digest);
        assert(cache.hitCount() == 2);
        assert(warm_time <= cold_time);
        assert(cold.digest == ChecksumCache::computeDigest(big.string()).digest);

        // A changed file gets a new key; the old entry is left to age out
        {
            std::ofstream out(abc, std::ios::binary | std::ios::app);
            out << "d";
        }
        auto changed = cache.digest(abc.string());
        assert(changed.ok());
        assert(changed.digest != abc_digest);
        assert(cache.size() == 3);

        auto missing = cache.digest((dir / "nothing.raw").string());
        assert(missing.status == AccessStatus::Missing);
        assert(cache.size() == 3);

        assert(cache.save());
        assert(fs::exists(cache_file));
        assert(!fs::exists(cache_file + ".tmp"));
    }

    // Reloaded entries answer without rehashing
    {
        ChecksumCache cache(cache_file);
        assert(cache.load());
        assert(cache.size() == 3);
        auto again = cache.digest(abc.string());
        assert(again.ok());
        assert(cache.hitCount() == 1);
    }

    // One over capacity evicts exactly one batch of the oldest entries
    {
        ChecksumCache cache((dir / "evict.json").string(), 1000, 100);
        for (int i = 0; i < 1000; ++i)
            cache.insert(ChecksumCache::makeKey("/f" + std::to_string(i), i, 0), "d");
        assert(cache.size() == 1000);
        assert(cache.evictionCount() == 0);

        cache.insert(ChecksumCache::makeKey("/f1000", 1000, 0), "newest");
        assert(cache.evictionCount() == 1);
        assert(cache.size() == 901);
        assert(!cache.lookup(ChecksumCache::makeKey("/f0", 0, 0)));
        assert(!cache.lookup(ChecksumCache::makeKey("/f99", 99, 0)));
        assert(cache.lookup(ChecksumCache::makeKey("/f100", 100, 0)));
        assert(cache.lookup(ChecksumCache::makeKey("/f1000", 1000, 0)) == std::string("newest"));
    }

    // The batch never removes the entry just inserted
    {
        ChecksumCache cache((dir / "tiny.json").string(), 2, 10);
        cache.insert("a|1|1", "1");
        cache.insert("b|1|1", "2");
        cache.insert("c|1|1", "3");
        assert(cache.size() == 1);
        assert(cache.lookup("c|1|1"));
    }

    assert(ChecksumCache::makeKey("/data/run.raw", 42, 1700000000) ==
           "/data/run.raw|42|1700000000");

    {
        std::ofstream out(dir / "corrupt.json");
        out << "[not json";
    }
    ChecksumCache corrupt((dir / "corrupt.json").string());
    assert(!corrupt.load());
    assert(corrupt.size() == 0);
    assert(!ChecksumCache((dir / "absent.json").string()).load());

    fs::remove_all(dir);
    return 0;
}
