#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "workspace/snapshot.hpp"

namespace protoforge::protocol {

enum class FileOpKind {
    Create,
    Modify,
    Delete,
    Rename
};

// One edit inside a PatchSet. Create carries full content. Modify carries
// either full content or a diff body. Rename carries new_path and may also
// carry content or a diff for the moved file.
struct FileOp {
    FileOpKind kind = FileOpKind::Modify;
    std::string path;
    std::string new_path;
    std::optional<std::string> content;
    std::optional<std::string> diff;
    bool overwrite = false;
};

struct PatchSet {
    std::vector<FileOp> ops;

    bool empty() const { return ops.empty(); }
};

enum class ConflictReason {
    // Raised by the snapshot store against a concrete base.
    PathNotFound,
    PathExists,
    ContextMismatch,
    // Raised by patch validation before any base is consulted.
    EmptyPatch,
    PathOutsideRoot,
    PatchTooLarge,
    DuplicatePath,
    // Raised when the generation round produced nothing usable.
    MalformedResponse,
    GenerationTimeout,
    GenerationFailed
};

struct Conflict {
    std::string path;
    ConflictReason reason;
    std::string detail;
};

struct Applied {
    workspace::SnapshotPtr snapshot;
};

struct ConflictReport {
    std::vector<Conflict> conflicts;
};

using ApplyResult = std::variant<Applied, ConflictReport>;

inline bool is_applied(const ApplyResult& result) {
    return std::holds_alternative<Applied>(result);
}

inline bool is_validation_reason(const ConflictReason reason) {
    return reason != ConflictReason::PathNotFound &&
           reason != ConflictReason::PathExists &&
           reason != ConflictReason::ContextMismatch;
}

inline std::string to_string(const FileOpKind kind) {
    switch (kind) {
        case FileOpKind::Create:
            return "create";
        case FileOpKind::Modify:
            return "modify";
        case FileOpKind::Delete:
            return "delete";
        case FileOpKind::Rename:
            return "rename";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ConflictReason reason) {
    switch (reason) {
        case ConflictReason::PathNotFound:
            return "path-not-found";
        case ConflictReason::PathExists:
            return "path-exists";
        case ConflictReason::ContextMismatch:
            return "context-mismatch";
        case ConflictReason::EmptyPatch:
            return "empty-patch";
        case ConflictReason::PathOutsideRoot:
            return "path-outside-root";
        case ConflictReason::PatchTooLarge:
            return "patch-too-large";
        case ConflictReason::DuplicatePath:
            return "duplicate-path";
        case ConflictReason::MalformedResponse:
            return "malformed-response";
        case ConflictReason::GenerationTimeout:
            return "generation-timeout";
        case ConflictReason::GenerationFailed:
            return "generation-failed";
        default:
            return "unknown";
    }
}

}  // namespace protoforge::protocol
