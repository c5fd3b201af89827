#pragma once
#include <string>

namespace tollgate::protocol {

    // How the orchestrator asks tollgate to do something
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "read_file" or "Read"
        std::string arguments;  // Raw JSON object of the arguments
    };

    // How tollgate replies back
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        std::string output;         // rendered tool output
        std::string error_message;  // rendered ToolError when success is false
        std::string error_code;     // ToolError::code, empty on success
        std::string error_category; // to_string(ErrorCategory), empty on success
        double duration_ms = 0.0;
    };

} // namespace tollgate::protocol
