#pragma once
#include "protocol/session_request.hpp"
#include "core/errors/forge_errors.hpp"

namespace protoforge::app::cli {
    protoforge::core::errors::Result<protoforge::protocol::SessionRequest> parse_and_validate(int argc, char* argv[]);
}
