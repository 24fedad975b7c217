#include "policy/code_reference_scanner.hpp"

namespace warden::policy {

using protocol::ScanResult;

ScanResult scan_code_references(const std::string& code, const FileAccessGuard* guard) {
    if (guard == nullptr || !guard->enabled() || guard->patterns().empty()) {
        return ScanResult{false, ""};
    }

    for (const auto& pattern : guard->patterns()) {
        if (pattern.negated || pattern.body.empty()) {
            continue;
        }
        if (pattern.body.front() == '*') {
            const std::string suffix = pattern.body.substr(1);
            if (!suffix.empty() && code.find(suffix) != std::string::npos) {
                return ScanResult{true, "Code references protected pattern '" +
                                            pattern.raw + "'"};
            }
            continue;
        }
        if (code.find(pattern.body) != std::string::npos) {
            return ScanResult{true, "Code references protected file/directory '" +
                                        pattern.raw + "'"};
        }
    }
    return ScanResult{false, ""};
}

}  // namespace warden::policy
