#include "core/config/security_config.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>

namespace warden::core::config {

using errors::ErrorCategory;
using errors::WardenError;
using nlohmann::json;

namespace {

WardenError invalid_field(const std::string& key, const std::string& expected) {
    return WardenError{ErrorCategory::Config,
                       "Config field '" + key + "' must be " + expected + ".",
                       "config_invalid_field"};
}

std::filesystem::path anchor(const std::filesystem::path& base_dir,
                             const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_relative() && !base_dir.empty()) {
        path = base_dir / path;
    }
    return path.lexically_normal();
}

// Reads an optional string path field; sets error on a type mismatch.
std::optional<std::filesystem::path> read_path(const json& doc, const std::string& key,
                                               const std::filesystem::path& base_dir,
                                               std::optional<WardenError>& error) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        error = invalid_field(key, "a non-empty string");
        return std::nullopt;
    }
    return anchor(base_dir, it->get<std::string>());
}

}  // namespace

errors::Result<SecurityConfig> parse_security_config(const std::string& json_text,
                                                     const std::filesystem::path& base_dir) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return WardenError{ErrorCategory::Config, "Config is not valid JSON.",
                           "config_parse_error"};
    }
    if (!doc.is_object()) {
        return WardenError{ErrorCategory::Config, "Config must be a JSON object.",
                           "config_parse_error"};
    }

    SecurityConfig config;
    std::optional<WardenError> error;

    config.blocklist_path = read_path(doc, "blocklist_path", base_dir, error);
    config.audit_log_path = read_path(doc, "audit_log_path", base_dir, error);
    config.working_directory = read_path(doc, "working_directory", base_dir, error);
    if (error) {
        return *error;
    }

    if (const auto it = doc.find("audit_retention_days"); it != doc.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0 ||
            it->get<std::int64_t>() > 36500) {
            return invalid_field("audit_retention_days", "an integer between 0 and 36500");
        }
        config.audit_retention_days = it->get<std::uint32_t>();
    }

    if (const auto it = doc.find("guard_enabled"); it != doc.end()) {
        if (!it->is_boolean()) {
            return invalid_field("guard_enabled", "a boolean");
        }
        config.guard_enabled = it->get<bool>();
    }

    if (const auto it = doc.find("log_level"); it != doc.end()) {
        if (!it->is_string()) {
            return invalid_field("log_level", "one of debug, info, warn, error");
        }
        const auto level = logging::parse_log_level(it->get<std::string>());
        if (!level) {
            return invalid_field("log_level", "one of debug, info, warn, error");
        }
        config.log_level = *level;
    }

    return config;
}

errors::Result<SecurityConfig> load_security_config(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec) || ec) {
        return WardenError{ErrorCategory::Config, "Config file not found: " + file.string(),
                           "config_not_found", "Pass an existing JSON file to --config."};
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return WardenError{ErrorCategory::Config, "Unable to open config file: " + file.string(),
                           "config_not_found"};
    }
    const std::string text((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());

    auto absolute = std::filesystem::absolute(file, ec);
    if (ec) {
        absolute = file;
    }
    return parse_security_config(text, absolute.parent_path());
}

} // namespace warden::core::config
