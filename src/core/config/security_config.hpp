#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"

namespace warden::core::config {

    // Settings for the access-control subsystem. Every field has a usable
    // default, so an empty config file (or none at all) is valid.
    struct SecurityConfig {
        std::optional<std::filesystem::path> blocklist_path;   // bundled default when unset
        std::optional<std::filesystem::path> audit_log_path;   // AuditLog::default_path() when unset
        std::uint32_t audit_retention_days = 30;
        std::optional<std::filesystem::path> working_directory;
        bool guard_enabled = true;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    // Loads a JSON config file. Relative paths inside it are resolved against
    // the directory holding the file.
    errors::Result<SecurityConfig> load_security_config(const std::filesystem::path& file);

    // Same, from already-read JSON text; base_dir anchors relative paths.
    errors::Result<SecurityConfig> parse_security_config(const std::string& json_text,
                                                         const std::filesystem::path& base_dir);

} // namespace warden::core::config
