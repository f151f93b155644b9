#pragma once

#include "core/errors/forge_errors.hpp"
#include "protocol/generation_contract.hpp"

namespace protoforge::generation {

// The model behind the loop. Implementations return a resolved response;
// a call that exceeds its time bound returns an ErrorCategory::Timeout error,
// any other failure ErrorCategory::Provider.
class GenerationService {
public:
    virtual ~GenerationService() = default;

    virtual core::errors::Result<protocol::GenerationResponse> generate(
        const protocol::GenerationRequest& request) = 0;
};

}  // namespace protoforge::generation
