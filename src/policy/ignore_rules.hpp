#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::policy {

// One gitignore-style rule. body has the leading '!' and trailing '/' removed.
struct IgnorePattern {
    std::string raw;
    bool negated = false;
    std::string body;

    static IgnorePattern from_line(const std::string& line);
};

// Reads an ignore file: trimmed lines, blanks and '#' comments dropped, order
// kept. A missing file yields an empty list.
std::vector<std::string> parse_ignore_file(const std::filesystem::path& path);

std::vector<IgnorePattern> compile_patterns(const std::vector<std::string>& lines);

// True if this single rule matches the '/'-separated relative path, ignoring
// the rule's negation flag.
bool pattern_matches(const IgnorePattern& pattern, const std::string& relative_path);

// Evaluates every rule in order; a later match overrides an earlier one, so a
// negated rule can re-include a path. Returns the raw text of the rule that
// left the path ignored, or nullopt if the path ends up not ignored.
std::optional<std::string> ignoring_pattern(const std::string& relative_path,
                                            const std::vector<IgnorePattern>& patterns);

bool is_ignored(const std::string& relative_path,
                const std::vector<IgnorePattern>& patterns);

}  // namespace warden::policy
