#include "ConflictResolver.hpp"
#include "FakeRemoteStore.hpp"
#include "FileSystemScanner.hpp"

#include <cassert>
#include <filesystem>

using labxfer::ConflictAction;
using labxfer::ConflictPolicy;
using labxfer::ConflictResolver;

int main() {
    namespace fs = std::filesystem;
    auto dir = labxfer_test::make_temp_dir("labxfer_conflict");
    auto file = (dir / "run.raw").string();
    labxfer_test::write_file(file, 64);
    const int64_t local_mtime = labxfer::FileSystemScanner::statFile(file)->mtime;
    const std::string local = std::string(64, 'a');
    const std::string remote = std::string(64, 'b');

    ConflictResolver resolver(ConflictPolicy::AskExternal);
    assert(resolver.resolve(file, local, remote) == ConflictAction::DeferToExternal);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::AlwaysUpload) ==
           ConflictAction::UploadOverwrite);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::AlwaysSkip) == ConflictAction::Skip);

    // PreferNewer compares modification times with a small tolerance
    assert(resolver.resolve(file, local, remote, ConflictPolicy::PreferNewer, local_mtime - 100) ==
           ConflictAction::UploadOverwrite);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::PreferNewer, local_mtime + 100) ==
           ConflictAction::Skip);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::PreferNewer, local_mtime - 1) ==
           ConflictAction::Skip);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::PreferNewer) ==
           ConflictAction::DeferToExternal);

    // A per-file override is used once
    resolver.setOverride(file, ConflictAction::RenameAndUpload);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::AlwaysSkip) ==
           ConflictAction::RenameAndUpload);
    assert(resolver.resolve(file, local, remote) == ConflictAction::DeferToExternal);
    resolver.setOverride(file, ConflictAction::Skip);
    resolver.clearOverride(file);
    assert(resolver.resolve(file, local, remote) == ConflictAction::DeferToExternal);

    // Apply-to-all answers would-be prompts but not explicit policies
    resolver.applyToAll(ConflictAction::UploadOverwrite);
    assert(resolver.batchOverride() == ConflictAction::UploadOverwrite);
    assert(resolver.resolve(file, local, remote) == ConflictAction::UploadOverwrite);
    assert(resolver.resolve("/elsewhere/other.raw", local, remote) == ConflictAction::UploadOverwrite);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::AlwaysSkip) == ConflictAction::Skip);
    assert(resolver.resolve(file, local, remote, ConflictPolicy::PreferNewer) ==
           ConflictAction::UploadOverwrite);
    resolver.clearApplyToAll();
    assert(!resolver.batchOverride());
    assert(resolver.resolve(file, local, remote) == ConflictAction::DeferToExternal);
    resolver.applyToAll(ConflictAction::DeferToExternal);
    assert(!resolver.batchOverride());

    resolver.setPolicy(ConflictPolicy::AlwaysUpload);
    assert(resolver.policy() == ConflictPolicy::AlwaysUpload);
    assert(resolver.resolve(file, local, remote) == ConflictAction::UploadOverwrite);

    assert(ConflictResolver::renamedPath("/lab/run/sample.raw", 1700000000) ==
           "/lab/run/conflict_1700000000_sample.raw");
    assert(ConflictResolver::renamedPath("/sample.raw", 5) == "/conflict_5_sample.raw");

    fs::remove_all(dir);
    return 0;
}
