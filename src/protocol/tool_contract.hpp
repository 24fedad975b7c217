#pragma once
#include <string>

namespace warden::protocol {

    // What a guarded tool operation reports back to the orchestration loop
    struct ToolResult {
        std::string tool;           // "read_file", "edit_file", "run_command"
        bool success = false;
        std::string output;         // stdout or file content
        std::string error_message;  // stderr or failure reason
        double duration_ms = 0.0;
    };

} // namespace warden::protocol
