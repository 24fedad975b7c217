#include "cli_parser.hpp"
#include <charconv>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace warden::app::cli {

    using namespace warden::core::errors;
    using warden::protocol::CliCommand;
    using warden::protocol::CliRequest;

    namespace {

        constexpr const char* kUsageHint =
            "Usage: warden <check-command|check-path|scan|patterns|audit-append|audit-prune> "
            "[--config FILE] [--log-level LEVEL] [options]";

        const std::set<std::string> kSwitches = {"--disable-guard"};
        const std::set<std::string> kGlobalFlags = {"--config", "--log-level"};

        std::optional<CliCommand> parse_command(const std::string& name) {
            if (name == "check-command") return CliCommand::CheckCommand;
            if (name == "check-path")    return CliCommand::CheckPath;
            if (name == "scan")          return CliCommand::Scan;
            if (name == "patterns")      return CliCommand::Patterns;
            if (name == "audit-append")  return CliCommand::AuditAppend;
            if (name == "audit-prune")   return CliCommand::AuditPrune;
            return std::nullopt;
        }

        std::set<std::string> command_flags(const CliCommand command) {
            switch (command) {
                case CliCommand::CheckCommand: return {"--command", "--blocklist", "--audit-log"};
                case CliCommand::CheckPath:    return {"--path", "--cwd", "--disable-guard", "--audit-log"};
                case CliCommand::Scan:         return {"--code", "--cwd", "--audit-log"};
                case CliCommand::Patterns:     return {"--cwd"};
                case CliCommand::AuditAppend:  return {"--event", "--details", "--audit-log"};
                case CliCommand::AuditPrune:   return {"--max-age-days", "--audit-log"};
                default: return {};
            }
        }

        Result<std::filesystem::path> validate_directory(const std::string& value) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool is_dir = std::filesystem::is_directory(p, ec);
            if (ec || !is_dir) {
                return WardenError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return WardenError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return WardenError{ErrorCategory::Input, "No command provided.", "missing_command", kUsageHint};
        }

        const std::string command_name = argv[1];
        const auto command = parse_command(command_name);
        if (!command) {
            return WardenError{ErrorCategory::Input, "Unknown command: " + command_name, "unknown_command", kUsageHint};
        }

        // 1. Parser phase: read flag/value pairs as raw strings
        std::map<std::string, std::string> raw;
        const auto allowed = command_flags(*command);
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (allowed.count(flag) == 0 && kGlobalFlags.count(flag) == 0) {
                return WardenError{ErrorCategory::Input, "Unknown argument for " + command_name + ": " + flag, "unknown_argument"};
            }
            if (kSwitches.count(flag) != 0) {
                raw[flag] = "";
                continue;
            }
            if (i + 1 >= args.size()) {
                return WardenError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            raw[flag] = args[++i];
        }
        const auto value_of = [&raw](const std::string& flag) -> std::optional<std::string> {
            const auto it = raw.find(flag);
            if (it == raw.end()) return std::nullopt;
            return it->second;
        };

        // 2. Validator phase: required flags, numbers, directories
        CliRequest req;
        req.command = *command;

        if (const auto config = value_of("--config")) {
            req.config_file = std::filesystem::path(*config);
        }
        if (const auto level_name = value_of("--log-level")) {
            const auto level = core::logging::parse_log_level(*level_name);
            if (!level) {
                return WardenError{ErrorCategory::Input, "Invalid log level: " + *level_name, "invalid_log_level", "Use debug, info, warn or error."};
            }
            req.log_level = *level;
        }
        if (const auto audit_log = value_of("--audit-log")) {
            req.audit_log_path = std::filesystem::path(*audit_log);
        }
        if (const auto blocklist = value_of("--blocklist")) {
            req.blocklist_path = std::filesystem::path(*blocklist);
        }
        if (const auto cwd = value_of("--cwd")) {
            auto dir = validate_directory(*cwd);
            if (is_error(dir)) {
                return get_error(dir);
            }
            req.working_directory = get_value(dir);
        }
        req.disable_guard = raw.count("--disable-guard") != 0;

        switch (req.command) {
            case CliCommand::CheckCommand:
                req.command_text = value_of("--command");
                if (!req.command_text || req.command_text->empty()) {
                    return WardenError{ErrorCategory::Input, "check-command requires a non-empty --command", "missing_required_flag"};
                }
                break;
            case CliCommand::CheckPath:
                if (const auto path = value_of("--path")) {
                    req.target_path = std::filesystem::path(*path);
                }
                if (!req.target_path || req.target_path->empty()) {
                    return WardenError{ErrorCategory::Input, "check-path requires --path", "missing_required_flag"};
                }
                break;
            case CliCommand::Scan:
                req.code = value_of("--code");
                if (!req.code) {
                    return WardenError{ErrorCategory::Input, "scan requires --code", "missing_required_flag"};
                }
                break;
            case CliCommand::AuditAppend:
                req.event_type = value_of("--event");
                if (!req.event_type || req.event_type->empty()) {
                    return WardenError{ErrorCategory::Input, "audit-append requires a non-empty --event", "missing_required_flag"};
                }
                req.details = value_of("--details").value_or("");
                break;
            case CliCommand::AuditPrune:
                if (const auto days_text = value_of("--max-age-days")) {
                    // Exception-free integer parsing
                    uint32_t days = 0;
                    const char* begin = days_text->data();
                    const char* end = days_text->data() + days_text->size();
                    auto [ptr, ec] = std::from_chars(begin, end, days);
                    if (ec != std::errc() || ptr != end) {
                        return WardenError{ErrorCategory::Input, "Invalid number for --max-age-days", "invalid_integer", "Provide a non-negative integer."};
                    }
                    if (days > 36500) {
                        return WardenError{ErrorCategory::Input, "--max-age-days out of bounds", "bounds_error", "Must be between 0 and 36500."};
                    }
                    req.max_age_days = days;
                }
                break;
            case CliCommand::Patterns:
                break;
        }

        return req;
    }

} // namespace warden::app::cli
