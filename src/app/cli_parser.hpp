#pragma once
#include "protocol/call_request.hpp"
#include "core/errors/tool_errors.hpp"

namespace tollgate::app::cli {
    tollgate::core::errors::Result<tollgate::protocol::CallRequest> parse_and_validate(int argc, char* argv[]);
}
