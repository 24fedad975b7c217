#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/commands.hpp"
#include "core/config/session_id.hpp"
#include "policy/command_blocklist.hpp"

namespace {

using nlohmann::json;
using warden::app::kExitAllowed;
using warden::app::kExitDenied;
using warden::app::run_command;
using warden::core::config::SecurityConfig;
using warden::protocol::CliCommand;
using warden::protocol::CliRequest;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_commands_" + warden::core::config::generate_session_id());
        std::filesystem::create_directories(root_ / "project");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path project() const { return root_ / "project"; }
    std::filesystem::path audit_log() const { return root_ / "audit/audit.log"; }

    // Config that keeps audit output inside the workspace.
    SecurityConfig config() const {
        SecurityConfig config;
        config.audit_log_path = audit_log();
        config.working_directory = project();
        return config;
    }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

struct Outcome {
    int exit_code;
    json verdict;
};

Outcome run(const CliRequest& request, const SecurityConfig& config) {
    std::ostringstream out;
    const int exit_code = run_command(request, config, out);
    return Outcome{exit_code, json::parse(out.str())};
}

TEST(CommandsTest, CheckCommandBlocksAndAudits) {
    TempWorkspace workspace;
    warden::policy::CommandBlocklist::reload();

    CliRequest request;
    request.command = CliCommand::CheckCommand;
    request.command_text = "rm -rf /";
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitDenied);
    EXPECT_TRUE(outcome.verdict["blocked"].get<bool>());
    EXPECT_EQ(outcome.verdict["pattern"].get<std::string>(), "rm -rf /");

    const auto lines = read_lines(workspace.audit_log());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(" | command_blocked | pattern=rm -rf / command=rm -rf /"),
              std::string::npos);
}

TEST(CommandsTest, CheckCommandAllowsHarmlessCommand) {
    TempWorkspace workspace;
    warden::policy::CommandBlocklist::reload();

    CliRequest request;
    request.command = CliCommand::CheckCommand;
    request.command_text = "ls -la";
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitAllowed);
    EXPECT_FALSE(outcome.verdict["blocked"].get<bool>());
    EXPECT_TRUE(outcome.verdict["pattern"].is_null());
    EXPECT_FALSE(std::filesystem::exists(workspace.audit_log()));
}

TEST(CommandsTest, CheckPathDeniesIgnoredFile) {
    TempWorkspace workspace;
    write_file(workspace.project() / ".gitignore", ".env\n");

    CliRequest request;
    request.command = CliCommand::CheckPath;
    request.target_path = ".env";
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitDenied);
    EXPECT_FALSE(outcome.verdict["allowed"].get<bool>());
    EXPECT_NE(outcome.verdict["reason"].get<std::string>().find("'.env'"), std::string::npos);
    EXPECT_EQ(outcome.verdict["working_directory"].get<std::string>(),
              workspace.project().string());

    const auto lines = read_lines(workspace.audit_log());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(" | file_access_denied | "), std::string::npos);
}

TEST(CommandsTest, CheckPathRequestOverridesConfig) {
    TempWorkspace workspace;
    write_file(workspace.project() / ".gitignore", ".env\n");

    CliRequest request;
    request.command = CliCommand::CheckPath;
    request.target_path = "/etc/passwd";
    request.disable_guard = true;
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitAllowed);
    EXPECT_TRUE(outcome.verdict["allowed"].get<bool>());
    EXPECT_EQ(outcome.verdict["reason"].get<std::string>(), "");
}

TEST(CommandsTest, CheckPathWithNonUtf8NameStillPrintsVerdict) {
    TempWorkspace workspace;

    CliRequest request;
    request.command = CliCommand::CheckPath;
    request.target_path = std::filesystem::path(std::string("report\xff.txt"));
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitAllowed);
    EXPECT_TRUE(outcome.verdict["allowed"].get<bool>());
    EXPECT_EQ(outcome.verdict["path"].get<std::string>(), "report\xEF\xBF\xBD.txt");
}

TEST(CommandsTest, DeniedNonUtf8PathIsReportedAndAudited) {
    TempWorkspace workspace;
    CliRequest request;
    request.command = CliCommand::CheckPath;
    request.target_path = std::filesystem::path(std::string("/tmp/\xff"));
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitDenied);
    EXPECT_FALSE(outcome.verdict["allowed"].get<bool>());
    EXPECT_NE(outcome.verdict["reason"].get<std::string>().find("outside"), std::string::npos);
    EXPECT_EQ(read_lines(workspace.audit_log()).size(), 1u);
}

TEST(CommandsTest, CheckPathWithoutWorkingDirectoryAllows) {
    TempWorkspace workspace;
    auto config = workspace.config();
    config.working_directory.reset();

    CliRequest request;
    request.command = CliCommand::CheckPath;
    request.target_path = "/etc/passwd";
    const auto outcome = run(request, config);

    EXPECT_EQ(outcome.exit_code, kExitAllowed);
    EXPECT_TRUE(outcome.verdict["working_directory"].is_null());
}

TEST(CommandsTest, ScanFlagsProtectedReference) {
    TempWorkspace workspace;
    write_file(workspace.project() / ".gitignore", "*.pem\n");

    CliRequest request;
    request.command = CliCommand::Scan;
    request.code = "cat certs/server.pem";
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitDenied);
    EXPECT_TRUE(outcome.verdict["flagged"].get<bool>());
    EXPECT_EQ(outcome.verdict["reason"].get<std::string>(),
              "Code references protected pattern '*.pem'");
}

TEST(CommandsTest, PatternsListsRulesInOrder) {
    TempWorkspace workspace;
    write_file(workspace.project() / ".gitignore", ".env\n");
    write_file(workspace.project() / ".ai-ignore", "!public.key\n*.key\n");

    CliRequest request;
    request.command = CliCommand::Patterns;
    const auto outcome = run(request, workspace.config());

    EXPECT_EQ(outcome.exit_code, kExitAllowed);
    const auto& patterns = outcome.verdict["patterns"];
    ASSERT_EQ(patterns.size(), 3u);
    EXPECT_EQ(patterns[0]["pattern"].get<std::string>(), ".env");
    EXPECT_FALSE(patterns[0]["negated"].get<bool>());
    EXPECT_EQ(patterns[1]["pattern"].get<std::string>(), "!public.key");
    EXPECT_TRUE(patterns[1]["negated"].get<bool>());
    EXPECT_EQ(outcome.verdict["protected_text"].get<std::string>(), "  - .env\n  - *.key");
}

TEST(CommandsTest, AuditAppendThenPrune) {
    TempWorkspace workspace;

    CliRequest append;
    append.command = CliCommand::AuditAppend;
    append.event_type = "manual_check";
    append.details = "ok";
    const auto appended = run(append, workspace.config());
    EXPECT_EQ(appended.exit_code, kExitAllowed);
    EXPECT_EQ(appended.verdict["event"].get<std::string>(), "manual_check");
    EXPECT_EQ(appended.verdict["audit_log"].get<std::string>(), workspace.audit_log().string());

    CliRequest keep;
    keep.command = CliCommand::AuditPrune;
    const auto kept = run(keep, workspace.config());
    EXPECT_EQ(kept.exit_code, kExitAllowed);
    EXPECT_EQ(kept.verdict["max_age_days"].get<int>(), 30);
    EXPECT_EQ(kept.verdict["kept"].get<int>(), 1);
    EXPECT_EQ(kept.verdict["removed"].get<int>(), 0);

    CliRequest drop;
    drop.command = CliCommand::AuditPrune;
    drop.max_age_days = 0;
    const auto dropped = run(drop, workspace.config());
    EXPECT_EQ(dropped.exit_code, kExitAllowed);
    EXPECT_EQ(dropped.verdict["removed"].get<int>(), 1);
    EXPECT_TRUE(read_lines(workspace.audit_log()).empty());
}

TEST(CommandsTest, RequestAuditLogOverridesConfig) {
    TempWorkspace workspace;
    const auto other = workspace.root() / "other.log";

    CliRequest request;
    request.command = CliCommand::AuditAppend;
    request.event_type = "redirected";
    request.audit_log_path = other;
    run(request, workspace.config());

    EXPECT_EQ(read_lines(other).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(workspace.audit_log()));
}

}  // namespace
