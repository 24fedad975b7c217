#pragma once
#include <ostream>
#include "core/config/security_config.hpp"
#include "protocol/cli_request.hpp"

namespace warden::app {

    // Process exit codes of the warden CLI
    enum ExitCode : int {
        kExitAllowed = 0,
        kExitDenied = 1,
        kExitInputError = 2,
        kExitConfigError = 3,
        kExitPruneFailed = 4
    };

    // Runs one validated request against the given configuration and writes a
    // single JSON object to `out`. Deny decisions are audited.
    int run_command(const protocol::CliRequest& request,
                    const core::config::SecurityConfig& config, std::ostream& out);

} // namespace warden::app
