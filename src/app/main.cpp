#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/commands.hpp"
#include "core/config/security_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process
    warden::core::logging::Logger::get().set_session_id(
        warden::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        const auto& err = warden::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return warden::app::kExitInputError;
    }
    const auto& req = warden::core::errors::get_value(parsed);

    // 3. Configuration: file first, then command-line overrides
    warden::core::config::SecurityConfig config;
    if (req.config_file) {
        auto loaded = warden::core::config::load_security_config(*req.config_file);
        if (warden::core::errors::is_error(loaded)) {
            const auto& err = warden::core::errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                LOG_INFO("Hint: " + err.hint);
            }
            return warden::app::kExitConfigError;
        }
        config = warden::core::errors::get_value(loaded);
    }
    warden::core::logging::Logger::get().set_level(req.log_level.value_or(config.log_level));

    LOG_DEBUG("Running " + warden::protocol::to_string(req.command));
    return warden::app::run_command(req, config, std::cout);
}
