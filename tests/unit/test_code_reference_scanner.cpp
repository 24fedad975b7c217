#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "policy/code_reference_scanner.hpp"

namespace {

using warden::policy::FileAccessGuard;
using warden::policy::scan_code_references;

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& ignore_text) {
        root_ = std::filesystem::current_path() /
                (".tmp_code_reference_" + warden::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
        std::ofstream out(root_ / ".gitignore");
        out << ignore_text;
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(CodeReferenceScannerTest, FlagsLiteralProtectedFile) {
    TempWorkspace workspace(".env\nsecrets/\n");
    FileAccessGuard guard(workspace.root());

    const auto result = scan_code_references("open('.env').read()", &guard);
    EXPECT_TRUE(result.flagged);
    EXPECT_EQ(result.reason, "Code references protected file/directory '.env'");
}

TEST(CodeReferenceScannerTest, FlagsDirectoryRuleWithoutTrailingSlash) {
    TempWorkspace workspace("secrets/\n");
    FileAccessGuard guard(workspace.root());

    const auto result = scan_code_references("cat secrets/api.txt", &guard);
    EXPECT_TRUE(result.flagged);
    EXPECT_EQ(result.reason, "Code references protected file/directory 'secrets/'");
}

TEST(CodeReferenceScannerTest, FlagsWildcardSuffix) {
    TempWorkspace workspace("*.pem\n");
    FileAccessGuard guard(workspace.root());

    const auto result = scan_code_references("with open('server.pem') as f: pass", &guard);
    EXPECT_TRUE(result.flagged);
    EXPECT_EQ(result.reason, "Code references protected pattern '*.pem'");
}

TEST(CodeReferenceScannerTest, IgnoresUnrelatedCode) {
    TempWorkspace workspace(".env\n*.pem\n");
    FileAccessGuard guard(workspace.root());

    const auto result = scan_code_references("print('hello world')", &guard);
    EXPECT_FALSE(result.flagged);
    EXPECT_TRUE(result.reason.empty());
}

TEST(CodeReferenceScannerTest, NeverFlagsNegatedRules) {
    TempWorkspace workspace("!public.txt\n");
    FileAccessGuard guard(workspace.root());

    EXPECT_FALSE(scan_code_references("cat public.txt", &guard).flagged);
}

TEST(CodeReferenceScannerTest, BareStarRuleFlagsNothing) {
    TempWorkspace workspace("*\n");
    FileAccessGuard guard(workspace.root());

    EXPECT_FALSE(scan_code_references("ls", &guard).flagged);
}

TEST(CodeReferenceScannerTest, NoGuardMeansNoFlag) {
    EXPECT_FALSE(scan_code_references("cat .env", nullptr).flagged);

    const auto disabled = FileAccessGuard::disabled();
    EXPECT_FALSE(scan_code_references("cat .env", &disabled).flagged);
}

}  // namespace
