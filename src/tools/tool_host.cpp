#include "tools/tool_host.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/code_reference_scanner.hpp"

namespace warden::tools {

using core::errors::ErrorCategory;
using core::errors::WardenError;
using protocol::ToolResult;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

double elapsed_ms_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                     started)
        .count();
}

bool is_probably_binary(const std::string& content) {
    constexpr std::size_t kSniffSize = 1024;
    const auto sniffed = std::min(content.size(), kSniffSize);
    return std::find(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(sniffed),
                     '\0') != content.begin() + static_cast<std::ptrdiff_t>(sniffed);
}

// Reads whatever is available; closes the descriptor at EOF or on error.
void drain_pipe(int& fd, std::string& out) {
    char buffer[4096];
    while (fd >= 0) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

core::errors::Result<ProcessCapture> run_shell(const std::string& command,
                                               const std::filesystem::path& cwd,
                                               const std::uint32_t timeout_ms) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return WardenError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        static_cast<void>(::close(out_pipe[0]));
        static_cast<void>(::close(out_pipe[1]));
        return WardenError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) {
        for (const int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            static_cast<void>(::close(fd));
        }
        return WardenError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(::setpgid(0, 0));
        if (::chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(::dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(::dup2(err_pipe[1], STDERR_FILENO));
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Own process group, so a timeout also reaches the shell's children.
    static_cast<void>(::setpgid(pid, pid));
    static_cast<void>(::close(out_pipe[1]));
    static_cast<void>(::close(err_pipe[1]));
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    for (const int fd : {out_fd, err_fd}) {
        static_cast<void>(::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK));
    }

    ProcessCapture capture;
    int status = 0;
    bool reaped = false;
    while (out_fd >= 0 || err_fd >= 0 || !reaped) {
        // Also applies after the shell exits: a background child may still
        // hold the pipes open.
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed_ms_since(started) > static_cast<double>(timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(::kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        for (const int fd : {out_fd, err_fd}) {
            if (fd >= 0) {
                fds[nfds].fd = fd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }
        }
        if (nfds > 0) {
            static_cast<void>(::poll(fds, nfds, 50));
        }
        drain_pipe(out_fd, capture.stdout_text);
        drain_pipe(err_fd, capture.stderr_text);

        if (!reaped && ::waitpid(pid, &status, WNOHANG) == pid) {
            reaped = true;
        } else if (!reaped && nfds == 0) {
            // Output closed early; keep enforcing the timeout without spinning.
            ::usleep(10000);
        }

        if (capture.timed_out && reaped) {
            // A child that left the process group can outlive the kill.
            for (int* fd : {&out_fd, &err_fd}) {
                if (*fd >= 0) {
                    static_cast<void>(::close(*fd));
                    *fd = -1;
                }
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }
    capture.duration_ms = elapsed_ms_since(started);
    return capture;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    return std::vector<std::string>(std::istream_iterator<std::string>(in),
                                    std::istream_iterator<std::string>());
}

// 2 * LCS / (|a| + |b|), in [0, 1].
double similarity(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    std::vector<std::size_t> previous(b.size() + 1, 0);
    std::vector<std::size_t> current(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            current[j] = (a[i - 1] == b[j - 1]) ? previous[j - 1] + 1
                                                 : std::max(previous[j], current[j - 1]);
        }
        std::swap(previous, current);
    }
    return 2.0 * static_cast<double>(previous[b.size()]) /
           static_cast<double>(a.size() + b.size());
}

}  // namespace

std::vector<std::string> closest_matches(const std::string& text, const std::string& content,
                                         const std::size_t count) {
    const auto words = split_words(content);
    const auto window = split_words(text).size();
    if (window == 0 || words.size() < window) {
        return {};
    }

    std::vector<std::pair<double, std::string>> scored;
    for (std::size_t i = 0; i + window <= words.size(); ++i) {
        std::string phrase = words[i];
        for (std::size_t k = 1; k < window; ++k) {
            phrase += " " + words[i + k];
        }
        const bool seen = std::any_of(scored.begin(), scored.end(),
                                      [&phrase](const auto& entry) { return entry.second == phrase; });
        if (!seen) {
            scored.emplace_back(similarity(text, phrase), std::move(phrase));
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });

    std::vector<std::string> matches;
    for (std::size_t i = 0; i < scored.size() && i < count; ++i) {
        matches.push_back(scored[i].second);
    }
    return matches;
}

ToolHost::ToolHost(std::shared_ptr<const policy::CommandBlocklist> blocklist,
                   policy::FileAccessGuard guard, audit::AuditLog audit_log)
    : blocklist_(std::move(blocklist)),
      guard_(std::move(guard)),
      audit_log_(std::move(audit_log)) {
    if (!blocklist_) {
        blocklist_ = policy::CommandBlocklist::shared();
    }
}

core::errors::Result<std::filesystem::path> ToolHost::authorize_path(
    const std::filesystem::path& path) const {
    const auto decision = guard_.is_path_allowed(path);
    if (!decision.allowed) {
        audit_log_.append("file_access_denied", decision.reason);
        LOG_WARN("Access denied: " + decision.reason);
        return WardenError{ErrorCategory::Policy, decision.reason, "access_denied"};
    }
    if (path.is_relative() && guard_.working_directory().has_value()) {
        return *guard_.working_directory() / path;
    }
    return path;
}

core::errors::Result<ToolResult> ToolHost::read_file(const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();
    auto authorized = authorize_path(path);
    if (core::errors::is_error(authorized)) {
        return core::errors::get_error(authorized);
    }
    const auto& file_path = core::errors::get_value(authorized);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolResult{"read_file", false, "",
                          "Not a readable regular file: " + file_path.string(), 0.0};
    }
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return ToolResult{"read_file", false, "", "Failed to open file: " + file_path.string(),
                          0.0};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ToolResult{"read_file", false, "",
                          "I/O error while reading file: " + file_path.string(), 0.0};
    }
    if (is_probably_binary(content)) {
        return ToolResult{"read_file", false, "",
                          "Refusing to read binary file: " + file_path.string(), 0.0};
    }
    return ToolResult{"read_file", true, std::move(content), "", elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::edit_file(const EditRequest& request) const {
    if (request.original_text.empty()) {
        return WardenError{ErrorCategory::Input, "Original text cannot be empty.",
                           "empty_original_text"};
    }

    const auto started = std::chrono::steady_clock::now();
    auto authorized = authorize_path(request.path);
    if (core::errors::is_error(authorized)) {
        return core::errors::get_error(authorized);
    }
    const auto& file_path = core::errors::get_value(authorized);

    std::string content;
    {
        std::ifstream in(file_path, std::ios::binary);
        if (!in.is_open()) {
            return WardenError{ErrorCategory::Io, "Failed to open file: " + file_path.string(),
                               "file_open_failed"};
        }
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (content.find(request.original_text) == std::string::npos) {
        const auto suggestions = closest_matches(request.original_text, content);
        std::string hint;
        for (const auto& suggestion : suggestions) {
            hint += hint.empty() ? suggestion : ", " + suggestion;
        }
        return WardenError{ErrorCategory::Input, "Original text not found in " + file_path.string(),
                           "text_not_found",
                           hint.empty() ? "" : "Did you mean one of these? " + hint};
    }

    std::string updated;
    std::size_t replacements = 0;
    std::size_t start = 0;
    while (true) {
        const auto pos = content.find(request.original_text, start);
        if (pos == std::string::npos) {
            updated.append(content, start, std::string::npos);
            break;
        }
        updated.append(content, start, pos - start);
        updated += request.replacement_text;
        start = pos + request.original_text.size();
        ++replacements;
    }

    {
        std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return WardenError{ErrorCategory::Io,
                               "Failed to open file for writing: " + file_path.string(),
                               "file_write_failed"};
        }
        out << updated;
        if (!out.good()) {
            return WardenError{ErrorCategory::Io, "Failed to write file: " + file_path.string(),
                               "file_write_failed"};
        }
    }

    audit_log_.append("file_edit", "path=" + request.path.string());
    return ToolResult{"edit_file", true,
                      "Replaced " + std::to_string(replacements) + " occurrence(s).", "",
                      elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::run_command(const CommandRequest& request) const {
    if (request.command.empty()) {
        return WardenError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }

    const auto blocked = blocklist_->is_blocked(request.command);
    if (blocked.blocked) {
        const std::string pattern = blocked.matched_pattern.value_or("");
        audit_log_.append("command_blocked", "pattern=" + pattern + " command=" + request.command);
        return WardenError{ErrorCategory::Policy,
                           "Blocked: command matches blocked pattern '" + pattern + "'",
                           "blocked_command"};
    }

    const auto scan = policy::scan_code_references(request.command, &guard_);
    if (scan.flagged) {
        audit_log_.append("protected_reference_blocked", scan.reason);
        return WardenError{ErrorCategory::Policy, "Blocked: " + scan.reason,
                           "protected_reference"};
    }

    auto cwd = authorize_path(request.working_directory);
    if (core::errors::is_error(cwd)) {
        return core::errors::get_error(cwd);
    }

    auto capture_result =
        run_shell(request.command, core::errors::get_value(cwd), request.timeout_ms);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    ToolResult result{"run_command", capture.exit_code == 0 && !capture.timed_out,
                      capture.stdout_text, capture.stderr_text, capture.duration_ms};
    if (capture.timed_out) {
        if (!result.error_message.empty()) {
            result.error_message += "\n";
        }
        result.error_message += "Command timed out.";
    } else if (!result.success && result.error_message.empty()) {
        result.error_message =
            "Command failed with exit code " + std::to_string(capture.exit_code);
    }
    return result;
}

}  // namespace warden::tools
