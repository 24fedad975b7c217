#include "policy/ignore_rules.hpp"

#include <fnmatch.h>
#include <fstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace warden::policy {

using core::text::starts_with;
using core::text::trim;

namespace {

bool glob_match(const std::string& pattern, const std::string& value) {
    // No FNM_PATHNAME: '*' may cross '/' boundaries, as gitignore-style tools
    // built on plain fnmatch do.
    return ::fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

std::string basename_of(const std::string& relative_path) {
    const auto slash = relative_path.rfind('/');
    if (slash == std::string::npos) {
        return relative_path;
    }
    return relative_path.substr(slash + 1);
}

bool is_under(const std::string& relative_path, const std::string& prefix) {
    return relative_path == prefix || starts_with(relative_path, prefix + "/");
}

}  // namespace

IgnorePattern IgnorePattern::from_line(const std::string& line) {
    IgnorePattern pattern;
    pattern.raw = line;
    pattern.negated = starts_with(line, "!");
    std::string body = pattern.negated ? line.substr(1) : line;
    while (!body.empty() && body.back() == '/') {
        body.pop_back();
    }
    pattern.body = std::move(body);
    return pattern;
}

std::vector<std::string> parse_ignore_file(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return lines;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("Ignore file exists but cannot be read: " + path.string());
        return lines;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<IgnorePattern> compile_patterns(const std::vector<std::string>& lines) {
    std::vector<IgnorePattern> patterns;
    patterns.reserve(lines.size());
    for (const auto& line : lines) {
        patterns.push_back(IgnorePattern::from_line(line));
    }
    return patterns;
}

bool pattern_matches(const IgnorePattern& pattern, const std::string& relative_path) {
    const std::string& pat = pattern.body;
    if (pat.empty()) {
        return false;
    }

    if (glob_match(pat, relative_path)) {
        return true;
    }
    if (glob_match(pat, basename_of(relative_path))) {
        return true;
    }
    const std::string kAnyDescendant = "/**";
    if (pat.size() > kAnyDescendant.size() &&
        pat.compare(pat.size() - kAnyDescendant.size(), kAnyDescendant.size(),
                    kAnyDescendant) == 0 &&
        is_under(relative_path, pat.substr(0, pat.size() - kAnyDescendant.size()))) {
        return true;
    }
    return is_under(relative_path, pat);
}

std::optional<std::string> ignoring_pattern(const std::string& relative_path,
                                            const std::vector<IgnorePattern>& patterns) {
    std::optional<std::string> decisive;
    for (const auto& pattern : patterns) {
        if (!pattern_matches(pattern, relative_path)) {
            continue;
        }
        if (pattern.negated) {
            decisive.reset();
        } else {
            decisive = pattern.raw;
        }
    }
    return decisive;
}

bool is_ignored(const std::string& relative_path,
                const std::vector<IgnorePattern>& patterns) {
    return ignoring_pattern(relative_path, patterns).has_value();
}

}  // namespace warden::policy
