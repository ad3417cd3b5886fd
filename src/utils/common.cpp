#include "utils/common.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>

namespace aide::utils {
namespace {

std::tm ToUtc(std::chrono::system_clock::time_point when) {
    const auto time = std::chrono::system_clock::to_time_t(when);
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    return utc_time;
}

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

std::string FormatIsoUtc(std::chrono::system_clock::time_point when) {
    const auto utc_time = ToUtc(when);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string NowIsoUtc() {
    return FormatIsoUtc(Now());
}

std::string FormatDateUtc(std::chrono::system_clock::time_point when) {
    const auto utc_time = ToUtc(when);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%d");
    return oss.str();
}

int HourUtc(std::chrono::system_clock::time_point when) {
    return ToUtc(when).tm_hour;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const auto ch : text) {
        if (ch == '\n') {
            if (!current.empty() && current.back() == '\r') {
                current.pop_back();
            }
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        if (current.back() == '\r') {
            current.pop_back();
        }
        lines.push_back(current);
    }
    return lines;
}

std::vector<std::string> SplitArgs(const std::string& value) {
    std::vector<std::string> args;
    std::string current;
    bool in_word = false;
    char quote = '\0';
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            } else if (ch == '\\' && quote == '"' && i + 1 < value.size()) {
                current.push_back(value[++i]);
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '\'' || ch == '"') {
            quote = ch;
            in_word = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (in_word) {
                args.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }
        if (ch == '\\' && i + 1 < value.size()) {
            current.push_back(value[++i]);
        } else {
            current.push_back(ch);
        }
        in_word = true;
    }
    if (in_word) {
        args.push_back(current);
    }
    return args;
}

std::size_t Utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (const auto ch : text) {
        if (!IsContinuationByte(static_cast<unsigned char>(ch))) {
            ++count;
        }
    }
    return count;
}

std::string Utf8Prefix(const std::string& text, std::size_t max_chars) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (count == max_chars) {
            return text.substr(0, i);
        }
        ++count;
    }
    return text;
}

std::vector<std::string> ChunkText(const std::string& text, std::size_t max_chars) {
    std::vector<std::string> chunks;
    if (max_chars == 0) {
        return chunks;
    }
    std::string rest = text;
    while (Utf8Length(rest) > max_chars) {
        const auto prefix = Utf8Prefix(rest, max_chars);
        auto cut = prefix.rfind('\n');
        if (cut == std::string::npos || cut < prefix.size() / 2) {
            cut = prefix.size();
        }
        chunks.push_back(rest.substr(0, cut));
        rest.erase(0, cut);
        if (!rest.empty() && rest.front() == '\n') {
            rest.erase(0, 1);
        }
    }
    if (!rest.empty()) {
        chunks.push_back(rest);
    }
    return chunks;
}

}  // namespace aide::utils
