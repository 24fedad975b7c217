#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "policy/ignore_rules.hpp"
#include "protocol/decision_contract.hpp"

namespace warden::policy {

// Confines file access to a working directory and honours the ignore rules
// found at its root (.gitignore first, then .ai-ignore). A guard is immutable;
// reconfiguring means constructing a new one.
//
// Containment is opt-in: a disabled guard, or one without a working
// directory, allows every path.
class FileAccessGuard {
public:
    static constexpr const char* kGenericIgnoreFile = ".gitignore";
    static constexpr const char* kAgentIgnoreFile = ".ai-ignore";

    explicit FileAccessGuard(std::optional<std::filesystem::path> working_directory,
                             bool enabled = true);

    static FileAccessGuard disabled();

    // Symlinks are resolved on both sides before comparing, so a link inside
    // the working directory cannot reach outside it. Relative paths are taken
    // relative to the working directory. Never throws.
    protocol::AccessDecision is_path_allowed(const std::filesystem::path& path) const;

    // "  - <pattern>" per non-negated rule, one per line; empty if none.
    std::string protected_patterns_text() const;

    bool enabled() const { return enabled_; }
    const std::optional<std::filesystem::path>& working_directory() const {
        return working_directory_;
    }
    const std::vector<IgnorePattern>& patterns() const { return patterns_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    bool enabled_;
    std::optional<std::filesystem::path> working_directory_;
    std::vector<IgnorePattern> patterns_;
};

}  // namespace warden::policy
