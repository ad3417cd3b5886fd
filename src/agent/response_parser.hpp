#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aide::agent {

struct ParsedResponse {
    // Response text with every [[send-file:...]] line removed.
    std::string text;
    // Requested paths, first occurrence wins, in order of appearance.
    std::vector<std::string> file_paths;
};

ParsedResponse ParseAgentResponse(const std::string& response);

struct FileSendCheck {
    // Set when the file may be sent.
    std::optional<std::filesystem::path> path;
    // Root-relative path on success, otherwise a human-readable rejection reason.
    std::string detail;
};

FileSendCheck ResolveFileForSend(const std::filesystem::path& root,
                                 const std::string& raw_path,
                                 std::uintmax_t max_size_bytes);

// Strips surrounding whitespace and caps the text at `limit` characters,
// marking the cut with a "[truncated]" trailer.
std::string TrimResult(const std::string& text, std::size_t limit);

}  // namespace aide::agent
