#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include "core/errors/warden_errors.hpp"

namespace warden::audit {

struct PruneSummary {
    std::size_t kept = 0;
    std::size_t removed = 0;
};

// Append-only event log, one "<UTC ISO-8601> | event_type | details" line per
// event. The file is always mode 0600.
//
// Appends from any number of threads or processes are safe: each one is a
// single O_APPEND write made under a shared flock. prune() takes the exclusive
// lock for its whole read-modify-write, so it can never lose an append that
// races with it.
class AuditLog {
public:
    static constexpr std::uint32_t kDefaultRetentionDays = 30;

    explicit AuditLog(std::filesystem::path log_file = default_path());

    // $WARDEN_AUDIT_LOG, else $XDG_CACHE_HOME/warden/audit.log, else
    // ~/.cache/warden/audit.log.
    static std::filesystem::path default_path();

    // Never throws and never reports failure to the caller: an audit problem
    // must not interrupt the operation being audited. Failures go to the
    // error log.
    void append(const std::string& event_type, const std::string& details = "") const;

    // Drops entries older than max_age_days. Lines whose timestamp cannot be
    // parsed are always kept. A missing log is not an error.
    core::errors::Result<PruneSummary> prune(
        std::uint32_t max_age_days = kDefaultRetentionDays) const;

    const std::filesystem::path& path() const { return log_file_; }

private:
    std::filesystem::path log_file_;
};

// Restricts an existing regular file to owner read/write. No-op for anything
// that is not a regular file.
std::error_code harden_permissions(const std::filesystem::path& path);

// now - max_age_days, or time_point::min() when that lies outside the clock's
// range.
std::chrono::system_clock::time_point retention_cutoff(
    std::chrono::system_clock::time_point now, std::uint32_t max_age_days);

std::string format_timestamp(std::chrono::system_clock::time_point time);

// Accepts YYYY-MM-DD[T ]HH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]; a missing
// offset means UTC. Dates the system clock cannot represent are rejected.
std::optional<std::chrono::system_clock::time_point> parse_timestamp(
    const std::string& text);

}  // namespace warden::audit
