#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include "protocol/patch_contract.hpp"

namespace protoforge::protocol {

    // What the generation service gets for one round.
    struct GenerationRequest {
        std::string spec_text;
        std::string tree_digest;      // file contents, bounded
        std::string feedback_digest;  // last round's outcome, bounded
        std::string system_prompt;
        std::string user_prompt;
        std::uint32_t iteration = 0;
        std::uint32_t budget = 0;
    };

    // The generator has nothing more to change.
    struct NoChange {};

    // Output that could not be turned into a PatchSet.
    struct MalformedResponse {
        std::string reason;
        std::string excerpt;
    };

    // Closed set of response shapes. Resolved once, right after the
    // generation call, and never passed around as raw text afterwards.
    using GenerationResponse = std::variant<PatchSet, NoChange, MalformedResponse>;

} // namespace protoforge::protocol
