#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/patch_contract.hpp"
#include "workspace/snapshot.hpp"

namespace protoforge::workspace {

// Issues snapshots and keeps every one of them, so callers can roll back to
// any earlier generation. Nothing here touches the filesystem except the
// explicit load_tree/checkout helpers.
class SnapshotStore {
public:
    SnapshotPtr create(const FileTree& tree);

    // Applies ops to base in order. Conflicts come back as a ConflictReport
    // and leave the store untouched; only a corrupted or foreign base is an
    // error (Internal).
    core::errors::Result<protocol::ApplyResult> derive(const SnapshotPtr& base,
                                                       const protocol::PatchSet& ops);

    SnapshotPtr at(std::uint64_t generation) const;
    SnapshotPtr latest() const;
    std::size_t size() const;

    // Reads a project directory, skipping VCS, tool, cache and build directories.
    static core::errors::Result<FileTree> load_tree(const std::filesystem::path& root);

    // Writes snapshot under root. Files that `previous` had and `snapshot`
    // does not are removed. Returns the number of files written.
    static core::errors::Result<std::size_t> checkout(const Snapshot& snapshot,
                                                      const std::filesystem::path& root,
                                                      const Snapshot* previous = nullptr);

private:
    SnapshotPtr publish(Snapshot::Entries entries);

    mutable std::mutex mutex_;
    std::uint64_t next_generation_ = 0;
    std::vector<SnapshotPtr> history_;
};

}  // namespace protoforge::workspace
