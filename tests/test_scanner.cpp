#include "FakeRemoteStore.hpp"
#include "FileSystemScanner.hpp"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <set>

using labxfer::AccessStatus;
using labxfer::FileSystemScanner;

namespace {

std::set<std::string> names(const std::vector<labxfer::WatchedFile> &files) {
    std::set<std::string> result;
    for (const auto &file : files)
        result.insert(std::filesystem::path(file.path).filename().string());
    return result;
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_scanner");
    labxfer_test::write_file(dir / "a.raw", 10);
    labxfer_test::write_file(dir / "b.RAW", 20);
    labxfer_test::write_file(dir / ".hidden.raw", 5);
    labxfer_test::write_file(dir / "~lock.raw", 5);
    labxfer_test::write_file(dir / "notes.txt", 5);
    labxfer_test::write_file(dir / "sub" / "c.wiff", 30);
    labxfer_test::write_file(dir / "sub" / "deep" / "d.raw", 40);

    FileSystemScanner recursive(dir.generic_string() + "/", {"raw", ".WIFF"}, true);
    auto found = recursive.scan();
    assert(found.size() == 4);
    auto found_names = names(found);
    assert(found_names.count("a.raw") && found_names.count("b.RAW"));
    assert(found_names.count("c.wiff") && found_names.count("d.raw"));
    for (const auto &file : found) {
        if (fs::path(file.path).filename() == "c.wiff") {
            assert(file.size == 30);
            assert(file.extension == ".wiff");
            assert(file.mtime > 0);
        }
    }

    FileSystemScanner flat(dir.generic_string(), {"raw", "wiff"}, false);
    auto top = names(flat.scan());
    assert(top.size() == 2);
    assert(!top.count("c.wiff"));
    assert(!flat.isCandidate((dir / "sub" / "c.wiff").generic_string()));
    assert(recursive.isCandidate((dir / "sub" / "c.wiff").generic_string()));

    assert(!recursive.isCandidate((dir / ".hidden.raw").generic_string()));
    assert(!recursive.isCandidate((dir / "~lock.raw").generic_string()));
    assert(!recursive.isCandidate((dir / "notes.txt").generic_string()));
    assert(!recursive.isCandidate("/somewhere/else/a.raw"));
    assert(!recursive.isInScope((dir.parent_path() / "x.raw").generic_string()));

    assert(recursive.toRelativePath((dir / "sub" / "c.wiff").generic_string()) ==
           "sub/c.wiff");
    assert(recursive.rootPath() == dir.generic_string());

    assert(FileSystemScanner::normalizeExtension("RAW") == ".raw");
    assert(FileSystemScanner::normalizeExtension(".mzML") == ".mzml");
    assert(FileSystemScanner::isHiddenName(".DS_Store"));
    assert(FileSystemScanner::isHiddenName("~$run.raw"));
    assert(!FileSystemScanner::isHiddenName("run.raw"));

    // An empty filter accepts every non-hidden file
    FileSystemScanner any(dir.generic_string(), {}, false);
    assert(names(any.scan()).count("notes.txt"));

    assert(FileSystemScanner::classifyErrno(EACCES) == AccessStatus::Locked);
    assert(FileSystemScanner::classifyErrno(EBUSY) == AccessStatus::Locked);
    assert(FileSystemScanner::classifyErrno(ENOENT) == AccessStatus::Missing);
    assert(FileSystemScanner::classifyErrno(EIO) == AccessStatus::IOError);

    std::ifstream stream;
    std::string error;
    assert(FileSystemScanner::openForRead((dir / "gone.raw").string(), stream, error) ==
           AccessStatus::Missing);
    assert(!error.empty());
    std::ifstream ok_stream;
    assert(FileSystemScanner::openForRead((dir / "a.raw").string(), ok_stream, error) ==
           AccessStatus::Ok);

    assert(!FileSystemScanner::statFile((dir / "sub").string()));
    assert(!FileSystemScanner::statFile((dir / "gone.raw").string()));

    // Directories removed while the walk is running do not end it early
    {
        auto tree = dir / "tree";
        for (int i = 0; i < 3; ++i)
            labxfer_test::write_file(tree / ("top" + std::to_string(i) + ".raw"), 8);
        for (int i = 0; i < 6; ++i)
            labxfer_test::write_file(tree / ("dir" + std::to_string(i)) / "inner.raw", 8);

        FileSystemScanner scanner(tree.generic_string(), {"raw"}, true);
        std::set<std::string> seen;
        bool pruned = false;
        std::size_t count = scanner.scan([&](const labxfer::WatchedFile &file) {
            seen.insert(file.path);
            if (pruned)
                return;
            pruned = true;
            fs::path keep = fs::path(file.path).parent_path();
            for (int i = 0; i < 6; ++i) {
                fs::path sub = tree / ("dir" + std::to_string(i));
                if (sub.generic_string() != keep.generic_string())
                    fs::remove_all(sub);
            }
        });
        assert(count == seen.size());
        for (int i = 0; i < 3; ++i)
            assert(seen.count((tree / ("top" + std::to_string(i) + ".raw")).generic_string()));
    }

    // A missing root is not an error
    FileSystemScanner absent((dir / "absent").generic_string(), {"raw"}, true);
    assert(absent.scan().empty());

    fs::remove_all(dir);
    return 0;
}
