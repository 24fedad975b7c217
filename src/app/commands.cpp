#include "app/commands.hpp"

#include <nlohmann/json.hpp>
#include "audit/audit_log.hpp"
#include "core/logging/logger.hpp"
#include "policy/code_reference_scanner.hpp"
#include "policy/command_blocklist.hpp"
#include "policy/file_access_guard.hpp"

namespace warden::app {

using nlohmann::json;
using protocol::CliCommand;
using protocol::CliRequest;

namespace {

audit::AuditLog make_audit_log(const CliRequest& request,
                               const core::config::SecurityConfig& config) {
    if (request.audit_log_path) {
        return audit::AuditLog(*request.audit_log_path);
    }
    if (config.audit_log_path) {
        return audit::AuditLog(*config.audit_log_path);
    }
    return audit::AuditLog();
}

policy::FileAccessGuard make_guard(const CliRequest& request,
                                   const core::config::SecurityConfig& config) {
    auto working_directory =
        request.working_directory ? request.working_directory : config.working_directory;
    return policy::FileAccessGuard(working_directory,
                                   config.guard_enabled && !request.disable_guard);
}

json working_directory_json(const policy::FileAccessGuard& guard) {
    if (!guard.working_directory()) {
        return nullptr;
    }
    return guard.working_directory()->string();
}

}  // namespace

int run_command(const CliRequest& request, const core::config::SecurityConfig& config,
                std::ostream& out) {
    json verdict;
    int exit_code = kExitAllowed;

    switch (request.command) {
        case CliCommand::CheckCommand: {
            const auto blocklist = policy::CommandBlocklist::shared(
                request.blocklist_path ? request.blocklist_path : config.blocklist_path);
            const auto decision = blocklist->is_blocked(request.command_text.value_or(""));
            verdict["blocked"] = decision.blocked;
            verdict["pattern"] = decision.matched_pattern ? json(*decision.matched_pattern)
                                                          : json(nullptr);
            if (decision.blocked) {
                make_audit_log(request, config)
                    .append("command_blocked", "pattern=" + *decision.matched_pattern +
                                                   " command=" + *request.command_text);
                exit_code = kExitDenied;
            }
            break;
        }
        case CliCommand::CheckPath: {
            const auto guard = make_guard(request, config);
            const auto decision = guard.is_path_allowed(request.target_path.value());
            verdict["path"] = request.target_path->string();
            verdict["allowed"] = decision.allowed;
            verdict["reason"] = decision.reason;
            verdict["working_directory"] = working_directory_json(guard);
            if (!decision.allowed) {
                make_audit_log(request, config).append("file_access_denied", decision.reason);
                exit_code = kExitDenied;
            }
            break;
        }
        case CliCommand::Scan: {
            const auto guard = make_guard(request, config);
            const auto result = policy::scan_code_references(request.code.value_or(""), &guard);
            verdict["flagged"] = result.flagged;
            verdict["reason"] = result.reason;
            if (result.flagged) {
                make_audit_log(request, config).append("protected_reference_blocked", result.reason);
                exit_code = kExitDenied;
            }
            break;
        }
        case CliCommand::Patterns: {
            const auto guard = make_guard(request, config);
            json patterns = json::array();
            for (const auto& pattern : guard.patterns()) {
                patterns.push_back({{"pattern", pattern.raw}, {"negated", pattern.negated}});
            }
            verdict["working_directory"] = working_directory_json(guard);
            verdict["patterns"] = patterns;
            verdict["protected_text"] = guard.protected_patterns_text();
            break;
        }
        case CliCommand::AuditAppend: {
            const auto audit_log = make_audit_log(request, config);
            audit_log.append(request.event_type.value_or(""), request.details);
            verdict["audit_log"] = audit_log.path().string();
            verdict["event"] = request.event_type.value_or("");
            break;
        }
        case CliCommand::AuditPrune: {
            const auto audit_log = make_audit_log(request, config);
            const auto days = request.max_age_days.value_or(config.audit_retention_days);
            const auto pruned = audit_log.prune(days);
            verdict["audit_log"] = audit_log.path().string();
            verdict["max_age_days"] = days;
            if (core::errors::is_error(pruned)) {
                const auto& err = core::errors::get_error(pruned);
                LOG_ERROR("Audit prune failed [" + err.code + "]: " + err.message);
                verdict["error"] = {{"code", err.code}, {"message", err.message}};
                exit_code = kExitPruneFailed;
                break;
            }
            verdict["kept"] = core::errors::get_value(pruned).kept;
            verdict["removed"] = core::errors::get_value(pruned).removed;
            break;
        }
    }

    // Paths are raw bytes; invalid UTF-8 is replaced rather than thrown on.
    out << verdict.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    return exit_code;
}

} // namespace warden::app
