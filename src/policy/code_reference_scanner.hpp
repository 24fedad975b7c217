#pragma once

#include <string>
#include "policy/file_access_guard.hpp"
#include "protocol/decision_contract.hpp"

namespace warden::policy {

// Flags code that names a path protected by the guard's ignore rules, before
// that code runs. Wildcard rules ("*.key") match on their suffix (".key");
// other rules match on their literal text. Negated rules are exceptions and
// are never reported. A null or disabled guard flags nothing.
protocol::ScanResult scan_code_references(const std::string& code,
                                          const FileAccessGuard* guard);

}  // namespace warden::policy
