#pragma once

#include <optional>
#include <string>

namespace warden::protocol {

// Verdict of the command blocklist. matched_pattern is the pattern as it was
// loaded, not the lower-cased form used for matching.
struct BlockDecision {
    bool blocked = false;
    std::optional<std::string> matched_pattern;
};

// Verdict of the file access guard. reason is empty when allowed.
struct AccessDecision {
    bool allowed = true;
    std::string reason;
};

// Verdict of the code reference scanner. reason is empty when not flagged.
struct ScanResult {
    bool flagged = false;
    std::string reason;
};

}  // namespace warden::protocol
