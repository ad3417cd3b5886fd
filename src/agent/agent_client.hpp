#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "exec/command_runner.hpp"
#include "utils/logging.hpp"

namespace aide::agent {

enum class AgentFailure {
    kNone,
    kLaunchFailed,
    kTimeout,
    kNonZeroExit
};

struct AgentRunResult {
    bool success = false;
    std::string message;
    // Session the next prompt for this chat should resume; empty when unknown.
    std::string session_id;
    AgentFailure failure = AgentFailure::kNone;
};

struct ParsedEvents {
    std::string session_id;
    // Text of the last agent_message item.
    std::string message;
    // Non-empty lines that were not JSON objects, in order.
    std::vector<std::string> raw_lines;
};

class AgentRunner {
public:
    virtual ~AgentRunner() = default;
    // Empty session_id starts a fresh session.
    virtual AgentRunResult Run(const std::string& prompt, const std::string& session_id) = 0;
};

// Drives a Codex-style CLI in `exec --json` mode, one process per prompt.
class AgentClient : public AgentRunner {
public:
    static constexpr std::size_t kMaxDiagnosticLines = 20;

    AgentClient(aide::config::AgentConfig config,
                std::filesystem::path root,
                aide::utils::Logger logger);

    AgentRunResult Run(const std::string& prompt, const std::string& session_id) override;

    std::vector<std::string> BuildCommand(const std::string& prompt,
                                          const std::string& session_id) const;

    static ParsedEvents ParseEventStream(const std::string& stdout_text);
    static std::vector<std::string> NonJsonLines(const std::string& text, std::size_t limit);
    static std::string SuccessText(const ParsedEvents& events);
    static std::string FailureText(const std::string& stdout_text, const std::string& stderr_text);

private:
    AgentRunResult Classify(const aide::exec::ExecResult& exec, const std::string& session_id) const;

    aide::config::AgentConfig config_;
    std::filesystem::path root_;
    aide::utils::Logger logger_;
};

}  // namespace aide::agent
