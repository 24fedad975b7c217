#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "audit/audit_log.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/command_blocklist.hpp"
#include "policy/file_access_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace warden::tools {

struct CommandRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;
};

struct EditRequest {
    std::filesystem::path path;
    std::string original_text;
    std::string replacement_text;
};

// File and shell operations on behalf of the model. Every operation asks the
// guard (and, for commands, the blocklist and the reference scanner) first;
// a denial is audited and returned as a Policy error, and nothing is read,
// written or spawned.
class ToolHost {
public:
    ToolHost(std::shared_ptr<const policy::CommandBlocklist> blocklist,
             policy::FileAccessGuard guard, audit::AuditLog audit_log);

    core::errors::Result<protocol::ToolResult> read_file(
        const std::filesystem::path& path) const;

    // Replaces every occurrence of original_text. Audited as "file_edit".
    core::errors::Result<protocol::ToolResult> edit_file(const EditRequest& request) const;

    core::errors::Result<protocol::ToolResult> run_command(
        const CommandRequest& request) const;

    const policy::FileAccessGuard& guard() const { return guard_; }

private:
    core::errors::Result<std::filesystem::path> authorize_path(
        const std::filesystem::path& path) const;

    std::shared_ptr<const policy::CommandBlocklist> blocklist_;
    policy::FileAccessGuard guard_;
    audit::AuditLog audit_log_;
};

// Up to `count` word windows of the content closest to `text`, best first.
std::vector<std::string> closest_matches(const std::string& text, const std::string& content,
                                         std::size_t count = 3);

}  // namespace warden::tools
