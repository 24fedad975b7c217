#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/warden_errors.hpp"
#include "protocol/decision_contract.hpp"

namespace warden::policy {

// Ordered list of dangerous-command patterns. A pattern is either a plain
// substring ("rm -rf /") or a two-stage pipe chain ("curl|bash") that matches
// when the left command is piped, directly or later in the chain, into the
// right one. Matching is textual defense-in-depth only: variable expansion,
// command substitution or encoding tricks are not seen through.
class CommandBlocklist {
public:
    CommandBlocklist() = default;
    explicit CommandBlocklist(std::vector<std::string> patterns);

    // Strict CSV load. The header must contain "command" and "type"; rows whose
    // type is "blocked" (case-insensitive) contribute their command.
    static core::errors::Result<CommandBlocklist> parse(
        const std::filesystem::path& source);

    // Lenient load: any parse failure is logged as a warning and yields an
    // empty blocklist.
    static CommandBlocklist load(const std::filesystem::path& source);

    // The installed copy of the bundled list when present, else the one in
    // the source tree.
    static std::filesystem::path default_source();

    // Process-wide cached blocklist. The first caller loads it (from source, or
    // the bundled default); later callers get the same instance whatever
    // source they pass, until reload() replaces it.
    static std::shared_ptr<const CommandBlocklist> shared(
        const std::optional<std::filesystem::path>& source = std::nullopt);
    static std::shared_ptr<const CommandBlocklist> reload(
        const std::optional<std::filesystem::path>& source = std::nullopt);

    protocol::BlockDecision is_blocked(const std::string& text) const;

    const std::vector<std::string>& patterns() const { return patterns_; }
    bool empty() const { return patterns_.empty(); }

private:
    struct CompiledPattern {
        std::string original;
        std::string lowered;
        std::optional<std::pair<std::string, std::string>> pipe_stages;
    };

    static bool pipe_chain_matches(const std::pair<std::string, std::string>& stages,
                                   const std::vector<std::string>& text_stages);

    std::vector<std::string> patterns_;
    std::vector<CompiledPattern> compiled_;
};

}  // namespace warden::policy
