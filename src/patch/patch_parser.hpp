#pragma once

#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/generation_contract.hpp"
#include "protocol/patch_contract.hpp"

namespace protoforge::patch {

// Turns raw generator output into the closed response variant. Accepts the
// "*** Begin Patch" envelope, git/unified diffs and JSON objects; anything
// else becomes MalformedResponse. Never throws.
protocol::GenerationResponse parse_generation_output(const std::string& raw);

// "*** Begin Patch" ... "*** End Patch", possibly surrounded by prose.
core::errors::Result<protocol::PatchSet> parse_envelope(const std::string& text);

// "--- a/x" / "+++ b/x" style diffs, with or without "diff --git" headers.
core::errors::Result<protocol::PatchSet> parse_unified_diff(const std::string& text);

}  // namespace protoforge::patch
