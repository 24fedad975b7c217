#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace warden::core::text {

    inline std::string lowercase(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        return value;
    }

    inline std::string trim(const std::string& value) {
        const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(value.begin(), value.end(), is_space);
        auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
        if (begin >= end) {
            return "";
        }
        return std::string(begin, end);
    }

    // Splits on every occurrence of the delimiter; empty fields are kept.
    inline std::vector<std::string> split(const std::string& value, const char delimiter) {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (true) {
            const auto pos = value.find(delimiter, start);
            if (pos == std::string::npos) {
                parts.push_back(value.substr(start));
                return parts;
            }
            parts.push_back(value.substr(start, pos - start));
            start = pos + 1;
        }
    }

    inline bool starts_with(const std::string& value, const std::string& prefix) {
        return value.compare(0, prefix.size(), prefix) == 0;
    }

} // namespace warden::core::text
