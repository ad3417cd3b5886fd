#pragma once

#include <chrono>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace aide::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// 2026-02-22T03:15:00Z
std::string FormatIsoUtc(std::chrono::system_clock::time_point when);
std::string NowIsoUtc();
// 2026-02-22
std::string FormatDateUtc(std::chrono::system_clock::time_point when);
int HourUtc(std::chrono::system_clock::time_point when);

std::string Trim(const std::string& value);
std::vector<std::string> SplitLines(const std::string& text);

// Shell-style word splitting: whitespace separated, single and double quotes group words.
std::vector<std::string> SplitArgs(const std::string& value);

std::size_t Utf8Length(const std::string& text);
// First `max_chars` code points of `text`.
std::string Utf8Prefix(const std::string& text, std::size_t max_chars);
// Splits into pieces of at most `max_chars` code points, preferring line breaks.
std::vector<std::string> ChunkText(const std::string& text, std::size_t max_chars);

}  // namespace aide::utils
