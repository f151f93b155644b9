#include "patch/patch_engine.hpp"

#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "patch/patch_parser.hpp"
#include "workspace/diff_apply.hpp"

namespace protoforge::patch {

using core::errors::ErrorCategory;
using protocol::Conflict;
using protocol::ConflictReason;
using protocol::ConflictReport;
using protocol::FileOp;
using protocol::FileOpKind;

namespace {

ConflictReason reason_for_path_error(const core::errors::ForgeError& error) {
    return error.category == ErrorCategory::Policy ? ConflictReason::PathOutsideRoot
                                                   : ConflictReason::MalformedResponse;
}

}  // namespace

PatchEngine::PatchEngine(PatchLimits limits) : limits_(std::move(limits)) {}

protocol::GenerationResponse PatchEngine::interpret(const std::string& raw) const {
    return parse_generation_output(raw);
}

ValidationOutcome PatchEngine::validate(const protocol::PatchSet& patch) const {
    ValidationOutcome outcome;
    if (patch.empty()) {
        outcome.violations.push_back(
            {"", ConflictReason::EmptyPatch, "patch set contains no operations"});
        return outcome;
    }

    std::set<std::string> touched;
    std::size_t payload_bytes = 0;

    auto claim = [&](const std::string& path) {
        if (!touched.insert(path).second) {
            outcome.violations.push_back({path, ConflictReason::DuplicatePath,
                                          "path is touched more than once"});
        }
    };

    for (const auto& op : patch.ops) {
        FileOp normalized = op;

        auto path = policy_guard_.validate_patch_path(op.path);
        if (core::errors::is_error(path)) {
            const auto& error = core::errors::get_error(path);
            outcome.violations.push_back({op.path, reason_for_path_error(error), error.message});
            continue;
        }
        normalized.path = core::errors::get_value(path);

        if (op.kind == FileOpKind::Rename) {
            auto destination = policy_guard_.validate_patch_path(op.new_path);
            if (core::errors::is_error(destination)) {
                const auto& error = core::errors::get_error(destination);
                outcome.violations.push_back(
                    {op.new_path, reason_for_path_error(error),
                     "rename destination: " + error.message});
                continue;
            }
            normalized.new_path = core::errors::get_value(destination);
        }

        const bool needs_body = op.kind == FileOpKind::Create || op.kind == FileOpKind::Modify;
        if (needs_body && !op.content.has_value() && !op.diff.has_value()) {
            outcome.violations.push_back({normalized.path, ConflictReason::MalformedResponse,
                                          protocol::to_string(op.kind) +
                                              " carries neither content nor a diff"});
            continue;
        }
        if (op.diff.has_value()) {
            auto hunks = workspace::parse_hunks(op.diff.value());
            if (core::errors::is_error(hunks)) {
                outcome.violations.push_back({normalized.path,
                                              ConflictReason::MalformedResponse,
                                              core::errors::get_error(hunks).message});
                continue;
            }
            payload_bytes += op.diff->size();
        }
        if (op.content.has_value()) {
            payload_bytes += op.content->size();
        }

        claim(normalized.path);
        if (op.kind == FileOpKind::Rename && normalized.new_path != normalized.path) {
            claim(normalized.new_path);
        }
        outcome.patch.ops.push_back(std::move(normalized));
    }

    if (payload_bytes > limits_.max_total_bytes) {
        outcome.violations.push_back(
            {"", ConflictReason::PatchTooLarge,
             std::to_string(payload_bytes) + " bytes exceeds the limit of " +
                 std::to_string(limits_.max_total_bytes)});
    }
    return outcome;
}

core::errors::Result<protocol::ApplyResult> PatchEngine::apply(
    workspace::SnapshotStore& store, const workspace::SnapshotPtr& base,
    const protocol::PatchSet& patch) const {
    auto outcome = validate(patch);
    if (!outcome.ok()) {
        LOG_DEBUG("PatchEngine: rejected patch with " +
                  std::to_string(outcome.violations.size()) + " violation(s)");
        return protocol::ApplyResult{ConflictReport{std::move(outcome.violations)}};
    }
    return store.derive(base, outcome.patch);
}

}  // namespace protoforge::patch
