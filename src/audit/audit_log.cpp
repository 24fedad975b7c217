#include "audit/audit_log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "audit/file_lock.hpp"
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace warden::audit {

using core::errors::ErrorCategory;
using core::errors::WardenError;

namespace {

constexpr mode_t kOwnerReadWrite = S_IRUSR | S_IWUSR;

std::string errno_text() {
    return std::strerror(errno);
}

// One event must stay one line.
std::string escape_line_breaks(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        if (c == '\n') {
            escaped += "\\n";
        } else if (c == '\r') {
            escaped += "\\r";
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path home_directory() {
    if (const auto home = env_value("HOME")) {
        return *home;
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }
    return std::filesystem::temp_directory_path();
}

bool write_all(const int fd, const std::string& data, off_t offset) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::pwrite(fd, data.data() + written, data.size() - written,
                                   offset + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool append_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

core::errors::Result<std::string> read_all(const int fd) {
    std::string content;
    char buffer[8192];
    off_t offset = 0;
    while (true) {
        const ssize_t n = ::pread(fd, buffer, sizeof(buffer), offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WardenError{ErrorCategory::Io,
                               "Failed to read audit log: " + errno_text(),
                               "audit_read_failed"};
        }
        if (n == 0) {
            return content;
        }
        content.append(buffer, static_cast<std::size_t>(n));
        offset += n;
    }
}

// Splits into lines that keep their trailing '\n'; a final unterminated
// fragment is returned as its own line.
std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        const auto end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

bool read_number(const std::string& text, std::size_t& pos, const std::size_t digits,
                 int& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += digits;
    out = value;
    return true;
}

bool expect_char(const std::string& text, std::size_t& pos, const char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

int days_in_month(const int year, const int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        return 29;
    }
    return kDays[month - 1];
}

// Keeps a day of headroom for the UTC offset applied after conversion.
constexpr std::int64_t kMaxClockSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max())
        .count() -
    86400;

}  // namespace

std::chrono::system_clock::time_point retention_cutoff(
    const std::chrono::system_clock::time_point now, const std::uint32_t max_age_days) {
    const auto max_age = std::chrono::hours(24) * static_cast<std::int64_t>(max_age_days);
    // Past the clock's range nothing can be old enough to drop.
    if (max_age >= std::chrono::duration_cast<std::chrono::hours>(
                       std::chrono::system_clock::duration::max())) {
        return std::chrono::system_clock::time_point::min();
    }
    return now - std::chrono::duration_cast<std::chrono::system_clock::duration>(max_age);
}

AuditLog::AuditLog(std::filesystem::path log_file) : log_file_(std::move(log_file)) {}

std::filesystem::path AuditLog::default_path() {
    if (const auto explicit_path = env_value("WARDEN_AUDIT_LOG")) {
        return *explicit_path;
    }
    std::filesystem::path cache_root;
    if (const auto xdg = env_value("XDG_CACHE_HOME")) {
        cache_root = *xdg;
    } else {
        cache_root = home_directory() / ".cache";
    }
    return cache_root / "warden" / "audit.log";
}

void AuditLog::append(const std::string& event_type, const std::string& details) const {
    const std::string line = format_timestamp(std::chrono::system_clock::now()) + " | " +
                             escape_line_breaks(event_type) + " | " +
                             escape_line_breaks(details) + "\n";

    std::error_code ec;
    const auto parent = log_file_.parent_path();
    if (!parent.empty()) {
        const bool created = std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Failed to write audit log: cannot create " + parent.string() + ": " +
                      ec.message());
            return;
        }
        if (created) {
            std::filesystem::permissions(parent, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
        }
    }

    UniqueFd fd(::open(log_file_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                       kOwnerReadWrite));
    if (!fd.valid()) {
        LOG_ERROR("Failed to write audit log: cannot open " + log_file_.string() + ": " +
                  errno_text());
        return;
    }
    if (::fchmod(fd.get(), kOwnerReadWrite) != 0) {
        LOG_ERROR("Audit log permissions could not be restricted on " + log_file_.string() +
                  ": " + errno_text());
    }

    const auto lock = ScopedFileLock::acquire(fd.get(), LockMode::Shared);
    if (core::errors::is_error(lock)) {
        LOG_ERROR("Failed to write audit log: " + core::errors::get_error(lock).message);
        return;
    }
    if (!append_all(fd.get(), line)) {
        LOG_ERROR("Failed to write audit log: " + errno_text());
    }
}

core::errors::Result<PruneSummary> AuditLog::prune(const std::uint32_t max_age_days) const {
    std::error_code ec;
    if (!std::filesystem::exists(log_file_, ec) || ec) {
        return PruneSummary{};
    }

    const auto cutoff = retention_cutoff(std::chrono::system_clock::now(), max_age_days);

    UniqueFd fd(::open(log_file_.c_str(), O_RDWR | O_CLOEXEC));
    if (!fd.valid()) {
        return WardenError{ErrorCategory::Io,
                           "Unable to open audit log for pruning: " + errno_text(),
                           "audit_open_failed"};
    }

    // Held until return, on every path.
    const auto lock = ScopedFileLock::acquire(fd.get(), LockMode::Exclusive);
    if (core::errors::is_error(lock)) {
        return core::errors::get_error(lock);
    }

    auto content_result = read_all(fd.get());
    if (core::errors::is_error(content_result)) {
        return core::errors::get_error(content_result);
    }
    const std::string& original = core::errors::get_value(content_result);

    PruneSummary summary;
    std::string kept;
    kept.reserve(original.size());
    for (const auto& line : split_lines(original)) {
        const auto bar = line.find('|');
        const auto stamp = parse_timestamp(core::text::trim(line.substr(0, bar)));
        if (!stamp.has_value() || *stamp >= cutoff) {
            kept += line;
            ++summary.kept;
        } else {
            ++summary.removed;
        }
    }

    if (summary.removed == 0) {
        return summary;
    }

    if (::ftruncate(fd.get(), 0) != 0) {
        return WardenError{ErrorCategory::Io,
                           "Unable to truncate audit log: " + errno_text(),
                           "audit_truncate_failed"};
    }
    if (!write_all(fd.get(), kept, 0)) {
        const std::string reason = errno_text();
        if (::ftruncate(fd.get(), 0) != 0 || !write_all(fd.get(), original, 0)) {
            LOG_ERROR("Audit log could not be restored after a failed prune: " +
                      log_file_.string());
        }
        return WardenError{ErrorCategory::Io, "Unable to rewrite audit log: " + reason,
                           "audit_rewrite_failed"};
    }

    LOG_DEBUG("Audit log pruned: kept " + std::to_string(summary.kept) + ", removed " +
              std::to_string(summary.removed));
    return summary;
}

std::error_code harden_permissions(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return ec;
    }
    std::filesystem::permissions(
        path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    return ec;
}

std::string format_timestamp(const std::chrono::system_clock::time_point time) {
    const auto since_epoch = time.time_since_epoch();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();

    const std::time_t as_time_t = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    ::gmtime_r(&as_time_t, &utc);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                  utc.tm_sec, static_cast<long long>(micros));
    return buffer;
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!read_number(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_number(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
        !read_number(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
        !read_number(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int offset_hours = 0;
            int offset_mins = 0;
            if (!read_number(text, pos, 2, offset_hours)) {
                return std::nullopt;
            }
            static_cast<void>(expect_char(text, pos, ':'));
            if (!read_number(text, pos, 2, offset_mins) || offset_hours > 23 ||
                offset_mins > 59) {
                return std::nullopt;
            }
            offset_minutes = offset_hours * 60 + offset_mins;
            if (sign == '-') {
                offset_minutes = -offset_minutes;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    const std::time_t seconds = ::timegm(&utc);
    if (seconds > kMaxClockSeconds || seconds < -kMaxClockSeconds) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::microseconds(micros) - std::chrono::minutes(offset_minutes);
}

}  // namespace warden::audit
