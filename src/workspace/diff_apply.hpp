#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace protoforge::workspace {

// One "@@" section of a diff body. Lines keep their ' ', '-' or '+' prefix.
struct DiffHunk {
    std::optional<std::size_t> old_start;  // from "@@ -L,N +L,N @@"
    std::size_t old_count = 0;
    std::string anchor;                    // from "@@ some line"
    bool end_of_file = false;              // "*** End of File"
    std::vector<std::string> lines;
};

// Validation error ("invalid_diff") when the body is not a sequence of hunks.
core::errors::Result<std::vector<DiffHunk>> parse_hunks(const std::string& diff);

// Applies the hunks in order. A hunk whose context or removed lines cannot be
// matched yields a Conflict error with code "context_mismatch".
core::errors::Result<std::string> apply_diff(const std::string& original,
                                             const std::string& diff);

}  // namespace protoforge::workspace
