#include "agent/prompt_builder.hpp"

#include <sstream>

#include "utils/common.hpp"

namespace aide::agent {
namespace {

constexpr const char* kSendFilesNote =
    "If the user should receive one or more files in the chat, append separate lines "
    "at the END of your answer in this format:\n"
    "[[send-file:daily/2026-02-22.md]]\n"
    "[[send-file:topics/note.md]]\n"
    "One path per line, relative to the working directory. "
    "Do not wrap these lines in a code block.";

constexpr const char* kRiskyActionNote =
    "Before any risky action (deleting data, restarting services, bulk edits) "
    "ask the user for explicit confirmation first, then proceed.";

std::string BootstrapPrefix(bool include_bootstrap, const std::string& instructions_file) {
    if (!include_bootstrap) {
        return {};
    }
    return "Before handling the request, open and read `" + instructions_file +
           "`. Follow it as the primary instructions for this session.\n\n";
}

std::string AttachmentsBlock(const std::vector<std::string>& attachments) {
    std::vector<std::string> lines;
    lines.reserve(attachments.size());
    for (const auto& item : attachments) {
        lines.push_back("- `" + item + "`");
    }
    return aide::utils::Join(lines, "\n");
}

}  // namespace

std::string BuildPrompt(const std::string& user_text,
                        const std::vector<std::string>& attachments,
                        bool include_bootstrap,
                        const std::string& instructions_file) {
    const auto text = aide::utils::Trim(user_text);
    std::ostringstream prompt;
    prompt << BootstrapPrefix(include_bootstrap, instructions_file);
    if (text.empty()) {
        prompt << "The user sent attachments without any text.\n";
    } else {
        prompt << text << "\n\n";
    }
    if (!attachments.empty()) {
        prompt << "User attachments (paths on the server):\n"
               << AttachmentsBlock(attachments) << "\n\n";
    }
    prompt << kSendFilesNote << "\n\n" << kRiskyActionNote;
    return prompt.str();
}

}  // namespace aide::agent
