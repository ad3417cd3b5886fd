#pragma once

#include <string>
#include <vector>

namespace aide::agent {

// Deterministic; the same inputs always produce the same prompt.
std::string BuildPrompt(const std::string& user_text,
                        const std::vector<std::string>& attachments,
                        bool include_bootstrap,
                        const std::string& instructions_file = "AGENTS.md");

}  // namespace aide::agent
