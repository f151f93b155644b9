#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace protoforge::workspace {

// Relative path -> file bytes.
using FileTree = std::map<std::string, std::string>;

// Immutable file tree. Blobs are shared between a snapshot and the snapshots
// derived from it, so deriving only copies the entries that change.
class Snapshot {
public:
    using Blob = std::shared_ptr<const std::string>;
    using Entries = std::map<std::string, Blob>;

    Snapshot(std::uint64_t generation, Entries entries);

    std::uint64_t generation() const { return generation_; }
    const std::string& digest() const { return digest_; }
    const Entries& entries() const { return entries_; }

    bool contains(const std::string& path) const;

    // nullptr when the path is not part of the snapshot.
    const std::string* content(const std::string& path) const;

    std::vector<std::string> paths() const;
    std::size_t file_count() const { return entries_.size(); }
    std::size_t total_bytes() const;
    FileTree to_tree() const;

    // Recomputes the digest from the entries and compares it to the stored one.
    bool verify() const;

    static std::string compute_digest(const Entries& entries);

private:
    std::uint64_t generation_;
    Entries entries_;
    std::string digest_;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

}  // namespace protoforge::workspace
