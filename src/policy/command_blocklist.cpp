#include "policy/command_blocklist.hpp"

#include <atomic>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

#ifndef WARDEN_INSTALLED_BLOCKLIST_PATH
#define WARDEN_INSTALLED_BLOCKLIST_PATH "/usr/local/share/warden/default_blocked_commands.csv"
#endif
#ifndef WARDEN_SOURCE_BLOCKLIST_PATH
#define WARDEN_SOURCE_BLOCKLIST_PATH "data/default_blocked_commands.csv"
#endif

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::WardenError;
using core::text::lowercase;
using core::text::split;
using core::text::starts_with;
using core::text::trim;

namespace {

using CsvRecord = std::vector<std::string>;

// RFC 4180 reader: quoted fields may hold commas, doubled quotes and newlines.
std::vector<CsvRecord> parse_csv(const std::string& content) {
    std::vector<CsvRecord> records;
    CsvRecord record;
    std::string field;
    bool in_quotes = false;
    bool record_has_data = false;

    std::size_t i = 0;
    if (starts_with(content, "\xEF\xBB\xBF")) {
        i = 3;
    }

    for (; i < content.size(); ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                record_has_data = true;
                break;
            case ',':
                record.push_back(field);
                field.clear();
                record_has_data = true;
                break;
            case '\r':
                break;
            case '\n':
                if (record_has_data || !field.empty()) {
                    record.push_back(field);
                    records.push_back(record);
                }
                record.clear();
                field.clear();
                record_has_data = false;
                break;
            default:
                field.push_back(c);
                record_has_data = true;
                break;
        }
    }
    if (record_has_data || !field.empty()) {
        record.push_back(field);
        records.push_back(record);
    }
    return records;
}

std::shared_ptr<const CommandBlocklist>& cached_blocklist() {
    static std::shared_ptr<const CommandBlocklist> cached;
    return cached;
}

std::mutex& cache_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

CommandBlocklist::CommandBlocklist(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {
    compiled_.reserve(patterns_.size());
    for (const auto& pattern : patterns_) {
        CompiledPattern compiled;
        compiled.original = pattern;
        compiled.lowered = trim(lowercase(pattern));
        if (compiled.lowered.find('|') != std::string::npos) {
            const auto parts = split(compiled.lowered, '|');
            if (parts.size() == 2) {
                compiled.pipe_stages = std::make_pair(trim(parts[0]), trim(parts[1]));
            }
        }
        compiled_.push_back(std::move(compiled));
    }
}

core::errors::Result<CommandBlocklist> CommandBlocklist::parse(
    const std::filesystem::path& source) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec) || ec) {
        return WardenError{ErrorCategory::Config,
                           "Blocklist source not found: " + source.string(),
                           "blocklist_not_found"};
    }

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        return WardenError{ErrorCategory::Config,
                           "Unable to open blocklist source: " + source.string(),
                           "blocklist_not_found"};
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());

    const auto records = parse_csv(content);
    if (records.empty()) {
        return WardenError{ErrorCategory::Config,
                           "Blocklist source '" + source.string() +
                               "' is missing required 'command' and/or 'type' columns.",
                           "blocklist_missing_columns"};
    }

    std::optional<std::size_t> command_col;
    std::optional<std::size_t> type_col;
    const auto& header = records.front();
    for (std::size_t col = 0; col < header.size(); ++col) {
        const std::string name = trim(header[col]);
        if (name == "command" && !command_col) {
            command_col = col;
        } else if (name == "type" && !type_col) {
            type_col = col;
        }
    }
    if (!command_col || !type_col) {
        return WardenError{ErrorCategory::Config,
                           "Blocklist source '" + source.string() +
                               "' is missing required 'command' and/or 'type' columns.",
                           "blocklist_missing_columns"};
    }

    std::vector<std::string> patterns;
    for (std::size_t row = 1; row < records.size(); ++row) {
        const auto& record = records[row];
        if (*type_col >= record.size() || *command_col >= record.size()) {
            continue;
        }
        if (lowercase(trim(record[*type_col])) != "blocked") {
            continue;
        }
        std::string command = trim(record[*command_col]);
        if (command.empty()) {
            continue;
        }
        patterns.push_back(std::move(command));
    }
    return CommandBlocklist(std::move(patterns));
}

CommandBlocklist CommandBlocklist::load(const std::filesystem::path& source) {
    auto parsed = parse(source);
    if (core::errors::is_error(parsed)) {
        LOG_WARN("Blocklist: " + core::errors::get_error(parsed).message +
                 " No commands loaded.");
        return CommandBlocklist();
    }
    auto blocklist = std::get<CommandBlocklist>(std::move(parsed));
    LOG_DEBUG("Blocklist: loaded " + std::to_string(blocklist.patterns().size()) +
              " patterns from " + source.string());
    return blocklist;
}

std::filesystem::path CommandBlocklist::default_source() {
    const std::filesystem::path installed(WARDEN_INSTALLED_BLOCKLIST_PATH);
    std::error_code ec;
    if (std::filesystem::is_regular_file(installed, ec) && !ec) {
        return installed;
    }
    return std::filesystem::path(WARDEN_SOURCE_BLOCKLIST_PATH);
}

std::shared_ptr<const CommandBlocklist> CommandBlocklist::shared(
    const std::optional<std::filesystem::path>& source) {
    // Double-checked: readers after initialization never take the mutex.
    if (auto cached = std::atomic_load(&cached_blocklist())) {
        return cached;
    }
    std::lock_guard<std::mutex> lock(cache_mutex());
    if (auto cached = std::atomic_load(&cached_blocklist())) {
        return cached;
    }
    auto loaded = std::make_shared<const CommandBlocklist>(
        load(source.value_or(default_source())));
    std::atomic_store(&cached_blocklist(), loaded);
    return loaded;
}

std::shared_ptr<const CommandBlocklist> CommandBlocklist::reload(
    const std::optional<std::filesystem::path>& source) {
    auto fresh = std::make_shared<const CommandBlocklist>(
        load(source.value_or(default_source())));
    std::lock_guard<std::mutex> lock(cache_mutex());
    std::atomic_store(&cached_blocklist(), fresh);
    return fresh;
}

bool CommandBlocklist::pipe_chain_matches(
    const std::pair<std::string, std::string>& stages,
    const std::vector<std::string>& text_stages) {
    for (std::size_t i = 0; i + 1 < text_stages.size(); ++i) {
        if (!starts_with(text_stages[i], stages.first)) {
            continue;
        }
        for (std::size_t j = i + 1; j < text_stages.size(); ++j) {
            if (starts_with(text_stages[j], stages.second)) {
                return true;
            }
        }
    }
    return false;
}

protocol::BlockDecision CommandBlocklist::is_blocked(const std::string& text) const {
    const std::string lowered = trim(lowercase(text));

    std::vector<std::string> text_stages;
    for (const auto& stage : split(lowered, '|')) {
        text_stages.push_back(trim(stage));
    }

    for (const auto& pattern : compiled_) {
        if (pattern.lowered.empty()) {
            continue;
        }
        if (pattern.pipe_stages && text_stages.size() >= 2 &&
            pipe_chain_matches(*pattern.pipe_stages, text_stages)) {
            return protocol::BlockDecision{true, pattern.original};
        }
        if (lowered.find(pattern.lowered) != std::string::npos) {
            return protocol::BlockDecision{true, pattern.original};
        }
    }
    return protocol::BlockDecision{false, std::nullopt};
}

}  // namespace warden::policy
