#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/generation_contract.hpp"
#include "protocol/patch_contract.hpp"
#include "workspace/snapshot_store.hpp"

namespace protoforge::patch {

struct PatchLimits {
    std::size_t max_total_bytes = 512 * 1024;  // content + diff bodies of one set
};

struct ValidationOutcome {
    protocol::PatchSet patch;  // paths normalized
    std::vector<protocol::Conflict> violations;

    bool ok() const { return violations.empty(); }
};

class PatchEngine {
public:
    explicit PatchEngine(PatchLimits limits = {});

    protocol::GenerationResponse interpret(const std::string& raw) const;

    // Checks a set without consulting any snapshot. All violations are
    // collected; the returned patch is only meaningful when ok().
    ValidationOutcome validate(const protocol::PatchSet& patch) const;

    // validate + derive. Validation failures come back as a ConflictReport
    // with validation reasons; only store faults are errors.
    core::errors::Result<protocol::ApplyResult> apply(workspace::SnapshotStore& store,
                                                      const workspace::SnapshotPtr& base,
                                                      const protocol::PatchSet& patch) const;

    const PatchLimits& limits() const { return limits_; }

private:
    PatchLimits limits_;
    policy::PolicyGuard policy_guard_;
};

}  // namespace protoforge::patch
