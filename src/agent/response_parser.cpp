#include "agent/response_parser.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

#include "utils/common.hpp"

namespace aide::agent {
namespace {

constexpr std::size_t kTruncationReserve = 120;
constexpr const char* kTruncationMarker = "\n\n[truncated]";

std::string StripQuotes(std::string value) {
    static const std::string kQuotes = "\"'`";
    while (value.size() >= 2 && kQuotes.find(value.front()) != std::string::npos &&
           value.back() == value.front()) {
        value = aide::utils::Trim(value.substr(1, value.size() - 2));
    }
    return value;
}

bool EscapesRoot(const std::filesystem::path& relative) {
    if (relative.empty()) {
        return true;
    }
    const auto first = *relative.begin();
    return first == "..";
}

}  // namespace

ParsedResponse ParseAgentResponse(const std::string& response) {
    static const std::regex kDirective(R"(^\[\[send-file:([^\]]*)\]\]$)");
    ParsedResponse parsed{};
    std::unordered_set<std::string> seen;
    std::vector<std::string> kept;
    for (const auto& line : aide::utils::SplitLines(response)) {
        const auto candidate = aide::utils::Trim(line);
        std::smatch match;
        if (!std::regex_match(candidate, match, kDirective)) {
            kept.push_back(line);
            continue;
        }
        const auto path = StripQuotes(aide::utils::Trim(match[1].str()));
        if (path.empty() || !seen.insert(path).second) {
            continue;
        }
        parsed.file_paths.push_back(path);
    }
    parsed.text = aide::utils::Trim(aide::utils::Join(kept, "\n"));
    return parsed;
}

FileSendCheck ResolveFileForSend(const std::filesystem::path& root,
                                 const std::string& raw_path,
                                 std::uintmax_t max_size_bytes) {
    FileSendCheck check{};
    std::error_code ec;
    const auto root_resolved = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        check.detail = "working directory is not accessible: " + root.string();
        return check;
    }
    std::filesystem::path candidate(raw_path);
    if (candidate.is_relative()) {
        candidate = root_resolved / candidate;
    }
    const auto resolved = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        check.detail = "cannot resolve path: " + raw_path;
        return check;
    }
    const auto relative = resolved.lexically_relative(root_resolved);
    if (EscapesRoot(relative)) {
        check.detail = "path is outside the working directory: " + raw_path;
        return check;
    }
    if (!std::filesystem::exists(resolved, ec)) {
        check.detail = "file not found: " + raw_path;
        return check;
    }
    if (!std::filesystem::is_regular_file(resolved, ec)) {
        check.detail = "not a regular file: " + raw_path;
        return check;
    }
    const auto size = std::filesystem::file_size(resolved, ec);
    if (ec) {
        check.detail = "cannot read file size: " + raw_path;
        return check;
    }
    if (size > max_size_bytes) {
        check.detail = "file is too large (" + std::to_string(size) + " bytes, limit " +
                       std::to_string(max_size_bytes) + "): " + raw_path;
        return check;
    }
    check.path = resolved;
    check.detail = relative.generic_string();
    return check;
}

std::string TrimResult(const std::string& text, std::size_t limit) {
    const auto clean = aide::utils::Trim(text);
    if (aide::utils::Utf8Length(clean) <= limit) {
        return clean;
    }
    const auto keep = limit > kTruncationReserve ? limit - kTruncationReserve : 0;
    return aide::utils::Utf8Prefix(clean, keep) + kTruncationMarker;
}

}  // namespace aide::agent
