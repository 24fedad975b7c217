#include "policy/file_access_guard.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::policy {

using protocol::AccessDecision;

namespace {

std::filesystem::path strip_trailing_separator(std::filesystem::path path) {
    if (path.has_relative_path() && path.filename().empty()) {
        return path.parent_path();
    }
    return path;
}

}  // namespace

FileAccessGuard::FileAccessGuard(std::optional<std::filesystem::path> working_directory,
                                 const bool enabled)
    : enabled_(enabled) {
    if (!working_directory.has_value()) {
        return;
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(*working_directory, ec);
    if (ec) {
        absolute = *working_directory;
    }
    working_directory_ = strip_trailing_separator(absolute.lexically_normal());

    if (!enabled_) {
        return;
    }
    auto lines = parse_ignore_file(*working_directory_ / kGenericIgnoreFile);
    const auto agent_lines = parse_ignore_file(*working_directory_ / kAgentIgnoreFile);
    lines.insert(lines.end(), agent_lines.begin(), agent_lines.end());
    patterns_ = compile_patterns(lines);
    LOG_DEBUG("FileAccessGuard: " + std::to_string(patterns_.size()) +
              " ignore patterns under " + working_directory_->string());
}

FileAccessGuard FileAccessGuard::disabled() {
    return FileAccessGuard(std::nullopt, false);
}

bool FileAccessGuard::is_within_root(const std::filesystem::path& root,
                                     const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

AccessDecision FileAccessGuard::is_path_allowed(const std::filesystem::path& path) const {
    if (!enabled_ || !working_directory_.has_value()) {
        return AccessDecision{true, ""};
    }

    std::error_code ec;
    const auto root =
        strip_trailing_separator(std::filesystem::weakly_canonical(*working_directory_, ec));
    if (ec) {
        return AccessDecision{false, "Unable to resolve working directory '" +
                                         working_directory_->string() + "'."};
    }

    std::filesystem::path candidate = path;
    if (candidate.is_relative()) {
        candidate = *working_directory_ / candidate;
    }
    const auto resolved =
        strip_trailing_separator(std::filesystem::weakly_canonical(candidate, ec));
    if (ec) {
        return AccessDecision{false, "Unable to resolve path '" + path.string() + "'."};
    }

    if (!is_within_root(root, resolved)) {
        return AccessDecision{false, "Path '" + path.string() +
                                         "' is outside the allowed working directory."};
    }

    std::string relative = resolved.lexically_relative(root).generic_string();
    if (relative.empty()) {
        relative = ".";
    }
    if (const auto pattern = ignoring_pattern(relative, patterns_)) {
        return AccessDecision{false, "Path '" + path.string() + "' matches ignore pattern '" +
                                         *pattern + "' and is blocked."};
    }
    return AccessDecision{true, ""};
}

std::string FileAccessGuard::protected_patterns_text() const {
    std::string text;
    for (const auto& pattern : patterns_) {
        if (pattern.negated) {
            continue;
        }
        if (!text.empty()) {
            text += "\n";
        }
        text += "  - " + pattern.raw;
    }
    return text;
}

}  // namespace warden::policy
