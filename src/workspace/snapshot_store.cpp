#include "workspace/snapshot_store.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "workspace/diff_apply.hpp"

namespace protoforge::workspace {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::Applied;
using protocol::Conflict;
using protocol::ConflictReason;
using protocol::ConflictReport;
using protocol::FileOp;
using protocol::FileOpKind;

namespace {

constexpr std::uintmax_t kMaxLoadedFileBytes = 8 * 1024 * 1024;

Snapshot::Blob make_blob(std::string content) {
    return std::make_shared<const std::string>(std::move(content));
}

// Produces the content a modify/rename/create should leave behind, or the
// conflict that prevents it.
std::optional<Conflict> resolve_content(const FileOp& op, const std::string& path,
                                        const std::string& original,
                                        Snapshot::Blob& out) {
    if (op.content.has_value()) {
        out = make_blob(op.content.value());
        return std::nullopt;
    }
    if (!op.diff.has_value()) {
        return std::nullopt;
    }
    auto patched = apply_diff(original, op.diff.value());
    if (core::errors::is_error(patched)) {
        return Conflict{path, ConflictReason::ContextMismatch,
                        core::errors::get_error(patched).message};
    }
    out = make_blob(core::errors::get_value(patched));
    return std::nullopt;
}

// A tree cannot hold both a file "pkg" and a file under "pkg/". Returns the
// entry that collides with path, if any.
std::optional<std::string> find_tree_collision(const Snapshot::Entries& entries,
                                               const std::string& path) {
    for (auto slash = path.find('/'); slash != std::string::npos;
         slash = path.find('/', slash + 1)) {
        const std::string parent = path.substr(0, slash);
        if (entries.count(parent) != 0) {
            return parent;
        }
    }
    const std::string as_directory = path + "/";
    const auto below = entries.lower_bound(as_directory);
    if (below != entries.end() && below->first.compare(0, as_directory.size(), as_directory) == 0) {
        return below->first;
    }
    return std::nullopt;
}

}  // namespace

SnapshotPtr SnapshotStore::publish(Snapshot::Entries entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto snapshot = std::make_shared<const Snapshot>(next_generation_++, std::move(entries));
    history_.push_back(snapshot);
    return snapshot;
}

SnapshotPtr SnapshotStore::create(const FileTree& tree) {
    Snapshot::Entries entries;
    for (const auto& file : tree) {
        entries.emplace(file.first, make_blob(file.second));
    }
    auto snapshot = publish(std::move(entries));
    LOG_DEBUG("SnapshotStore: created generation " +
              std::to_string(snapshot->generation()) + " (" +
              std::to_string(snapshot->file_count()) + " files, digest " +
              snapshot->digest() + ")");
    return snapshot;
}

core::errors::Result<protocol::ApplyResult> SnapshotStore::derive(
    const SnapshotPtr& base, const protocol::PatchSet& ops) {
    if (!base) {
        return ForgeError{ErrorCategory::Internal, "Cannot derive from a null snapshot.",
                          "invalid_snapshot"};
    }
    if (at(base->generation()) != base) {
        return ForgeError{ErrorCategory::Internal,
                          "Snapshot generation " + std::to_string(base->generation()) +
                              " was not issued by this store.",
                          "foreign_snapshot"};
    }
    if (!base->verify()) {
        return ForgeError{ErrorCategory::Internal,
                          "Snapshot generation " + std::to_string(base->generation()) +
                              " failed its digest check.",
                          "snapshot_store_corrupted"};
    }

    // Shares every blob with base; only the entries touched below change.
    Snapshot::Entries working = base->entries();
    std::vector<Conflict> conflicts;
    std::vector<std::string> written_paths;

    for (const auto& op : ops.ops) {
        const auto existing = working.find(op.path);
        const bool present = existing != working.end();

        switch (op.kind) {
            case FileOpKind::Create: {
                if (present && !op.overwrite) {
                    conflicts.push_back(
                        {op.path, ConflictReason::PathExists, "file already exists"});
                    break;
                }
                Snapshot::Blob blob = make_blob("");
                if (auto conflict = resolve_content(op, op.path, "", blob)) {
                    conflicts.push_back(conflict.value());
                    break;
                }
                working[op.path] = blob;
                written_paths.push_back(op.path);
                break;
            }
            case FileOpKind::Modify: {
                if (!present) {
                    conflicts.push_back(
                        {op.path, ConflictReason::PathNotFound, "file does not exist"});
                    break;
                }
                Snapshot::Blob blob = existing->second;
                if (auto conflict = resolve_content(op, op.path, *existing->second, blob)) {
                    conflicts.push_back(conflict.value());
                    break;
                }
                existing->second = blob;
                break;
            }
            case FileOpKind::Delete: {
                if (!present) {
                    conflicts.push_back(
                        {op.path, ConflictReason::PathNotFound, "file does not exist"});
                    break;
                }
                working.erase(existing);
                break;
            }
            case FileOpKind::Rename: {
                if (!present) {
                    conflicts.push_back(
                        {op.path, ConflictReason::PathNotFound, "file does not exist"});
                    break;
                }
                if (op.new_path != op.path && working.count(op.new_path) != 0 &&
                    !op.overwrite) {
                    conflicts.push_back({op.new_path, ConflictReason::PathExists,
                                         "rename destination already exists"});
                    break;
                }
                Snapshot::Blob blob = existing->second;
                if (auto conflict = resolve_content(op, op.path, *existing->second, blob)) {
                    conflicts.push_back(conflict.value());
                    break;
                }
                working.erase(existing);
                working[op.new_path] = blob;
                written_paths.push_back(op.new_path);
                break;
            }
        }
    }

    // Checked against the final tree so a set that deletes "pkg" and creates
    // "pkg/mod.py" in one go is accepted.
    if (conflicts.empty()) {
        for (const auto& path : written_paths) {
            if (working.count(path) == 0) {
                continue;
            }
            if (const auto other = find_tree_collision(working, path)) {
                conflicts.push_back({path, ConflictReason::PathExists,
                                     "collides with file '" + other.value() +
                                         "' (a path cannot be both a file and a directory)"});
            }
        }
    }

    if (!conflicts.empty()) {
        LOG_DEBUG("SnapshotStore: derive from generation " +
                  std::to_string(base->generation()) + " rejected with " +
                  std::to_string(conflicts.size()) + " conflict(s)");
        return protocol::ApplyResult{ConflictReport{std::move(conflicts)}};
    }

    auto derived = publish(std::move(working));
    LOG_DEBUG("SnapshotStore: derived generation " + std::to_string(derived->generation()) +
              " from " + std::to_string(base->generation()));
    return protocol::ApplyResult{Applied{derived}};
}

SnapshotPtr SnapshotStore::at(const std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation >= history_.size()) {
        return nullptr;
    }
    return history_[static_cast<std::size_t>(generation)];
}

SnapshotPtr SnapshotStore::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) {
        return nullptr;
    }
    return history_.back();
}

std::size_t SnapshotStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

core::errors::Result<FileTree> SnapshotStore::load_tree(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Project root is not a directory: " + root.string(),
                          "invalid_workspace_root"};
    }

    FileTree tree;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to scan project root: " + root.string(),
                          "workspace_scan_failed"};
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return ForgeError{ErrorCategory::Input,
                              "Unable to scan project root: " + ec.message(),
                              "workspace_scan_failed"};
        }
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (policy::is_reserved_name(name)) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) {
            continue;
        }
        const auto size = entry.file_size(ec);
        if (ec || size > kMaxLoadedFileBytes) {
            LOG_WARN("SnapshotStore: skipping oversized or unreadable file " +
                     entry.path().string());
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in.is_open()) {
            return ForgeError{ErrorCategory::Input,
                              "Failed to open project file: " + entry.path().string(),
                              "workspace_read_failed"};
        }
        std::string content((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
        const auto relative = entry.path().lexically_relative(root).generic_string();
        tree.emplace(relative, std::move(content));
    }
    return tree;
}

core::errors::Result<std::size_t> SnapshotStore::checkout(
    const Snapshot& snapshot, const std::filesystem::path& root,
    const Snapshot* previous) {
    const policy::PolicyGuard policy_guard;
    std::size_t written = 0;

    for (const auto& entry : snapshot.entries()) {
        auto allowed = policy_guard.validate_patch_path(entry.first);
        if (core::errors::is_error(allowed)) {
            return core::errors::get_error(allowed);
        }
        auto resolved = policy_guard.validate_path_in_workspace(root, entry.first);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        const auto target = core::errors::get_value(resolved);
        const std::string& content = entry.second ? *entry.second : std::string();

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return ForgeError{ErrorCategory::Internal,
                              "Unable to create directory: " + target.parent_path().string(),
                              "checkout_dir_failed"};
        }

        // Write beside the target and rename over it so readers never see a torn file.
        auto staging = target;
        staging += ".protoforge-tmp";
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return ForgeError{ErrorCategory::Internal,
                                  "Unable to open file for checkout: " + staging.string(),
                                  "checkout_open_failed"};
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!out.good()) {
                return ForgeError{ErrorCategory::Internal,
                                  "Unable to write file: " + staging.string(),
                                  "checkout_write_failed"};
            }
        }
        std::filesystem::rename(staging, target, ec);
        if (ec) {
            std::filesystem::remove(staging, ec);
            return ForgeError{ErrorCategory::Internal,
                              "Unable to move file into place: " + target.string(),
                              "checkout_write_failed"};
        }
        ++written;
    }

    if (previous != nullptr) {
        for (const auto& entry : previous->entries()) {
            if (snapshot.contains(entry.first)) {
                continue;
            }
            auto resolved = policy_guard.validate_path_in_workspace(root, entry.first);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }
            std::error_code ec;
            std::filesystem::remove(core::errors::get_value(resolved), ec);
            if (ec) {
                return ForgeError{ErrorCategory::Internal,
                                  "Unable to remove file: " + entry.first,
                                  "checkout_remove_failed"};
            }
        }
    }

    return written;
}

}  // namespace protoforge::workspace
