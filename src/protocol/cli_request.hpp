#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace warden::protocol {

    enum class CliCommand {
        CheckCommand,   // blocklist verdict for a command line
        CheckPath,      // guard verdict for a path
        Scan,           // reference scan of a code snippet
        Patterns,       // protected patterns of a working directory
        AuditAppend,    // write one audit event
        AuditPrune      // apply retention to the audit log
    };

    // Validated CLI input. Only the fields relevant to `command` are set.
    struct CliRequest {
        CliCommand command = CliCommand::CheckCommand;
        std::optional<std::filesystem::path> config_file;
        std::optional<core::logging::LogLevel> log_level;

        std::optional<std::string> command_text;
        std::optional<std::filesystem::path> blocklist_path;

        std::optional<std::filesystem::path> target_path;
        std::optional<std::filesystem::path> working_directory;
        bool disable_guard = false;

        std::optional<std::string> code;

        std::optional<std::string> event_type;
        std::string details;
        std::optional<std::uint32_t> max_age_days;
        std::optional<std::filesystem::path> audit_log_path;
    };

    inline std::string to_string(const CliCommand command) {
        switch (command) {
            case CliCommand::CheckCommand: return "check-command";
            case CliCommand::CheckPath:    return "check-path";
            case CliCommand::Scan:         return "scan";
            case CliCommand::Patterns:     return "patterns";
            case CliCommand::AuditAppend:  return "audit-append";
            case CliCommand::AuditPrune:   return "audit-prune";
            default: return "unknown";
        }
    }

} // namespace warden::protocol
