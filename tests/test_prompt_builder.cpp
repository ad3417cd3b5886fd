#include <gtest/gtest.h>

#include "agent/prompt_builder.hpp"

namespace {

using aide::agent::BuildPrompt;

TEST(PromptBuilderTest, BootstrapOnlyForFreshSessions) {
    const auto fresh = BuildPrompt("hello", {}, true);
    const auto resumed = BuildPrompt("hello", {}, false);
    EXPECT_EQ(fresh.rfind("Before handling the request, open and read `AGENTS.md`.", 0), 0u);
    EXPECT_EQ(resumed.find("AGENTS.md"), std::string::npos);
    EXPECT_EQ(resumed.rfind("hello\n\n", 0), 0u);
}

TEST(PromptBuilderTest, CustomInstructionsFile) {
    const auto prompt = BuildPrompt("hi", {}, true, "docs/ASSISTANT.md");
    EXPECT_NE(prompt.find("`docs/ASSISTANT.md`"), std::string::npos);
}

TEST(PromptBuilderTest, ListsAttachments) {
    const auto prompt = BuildPrompt("see files", {"inbox_files/a.jpg", "inbox_files/b.pdf"}, false);
    EXPECT_NE(prompt.find("User attachments (paths on the server):\n"
                          "- `inbox_files/a.jpg`\n"
                          "- `inbox_files/b.pdf`"),
              std::string::npos);
}

TEST(PromptBuilderTest, AttachmentsWithoutText) {
    const auto prompt = BuildPrompt("   ", {"inbox_files/a.jpg"}, false);
    EXPECT_EQ(prompt.rfind("The user sent attachments without any text.\n", 0), 0u);
}

TEST(PromptBuilderTest, AlwaysCarriesProtocolNotes) {
    const auto prompt = BuildPrompt("hello", {}, false);
    EXPECT_NE(prompt.find("[[send-file:daily/2026-02-22.md]]"), std::string::npos);
    EXPECT_NE(prompt.find("explicit confirmation"), std::string::npos);
}

TEST(PromptBuilderTest, Deterministic) {
    EXPECT_EQ(BuildPrompt("x", {"a"}, true), BuildPrompt("x", {"a"}, true));
}

}  // namespace
