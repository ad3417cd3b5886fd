#include "agent/agent_client.hpp"

#include <chrono>
#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace aide::agent {
namespace {

constexpr const char* kNoTextAnswer = "The model finished without returning a text answer.";
constexpr const char* kFailureHeader = "The agent request failed.";
constexpr const char* kFailureNoDetails = "The agent request failed without any diagnostic output.";

std::string GetString(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

AgentClient::AgentClient(aide::config::AgentConfig config,
                         std::filesystem::path root,
                         aide::utils::Logger logger)
    : config_(std::move(config))
    , root_(std::move(root))
    , logger_(std::move(logger)) {}

std::vector<std::string> AgentClient::BuildCommand(const std::string& prompt,
                                                   const std::string& session_id) const {
    std::vector<std::string> command{config_.bin};
    if (config_.search) {
        command.push_back("--search");
    }
    command.insert(command.end(), {
        "exec",
        "--json",
        "--skip-git-repo-check",
        "--cd",
        root_.string()
    });
    if (!config_.model.empty()) {
        command.push_back("-m");
        command.push_back(config_.model);
    }
    for (auto& arg : aide::utils::SplitArgs(config_.extra_args)) {
        command.push_back(std::move(arg));
    }
    if (!session_id.empty()) {
        command.push_back("resume");
        command.push_back(session_id);
    }
    command.push_back(prompt);
    return command;
}

AgentRunResult AgentClient::Run(const std::string& prompt, const std::string& session_id) {
    const auto command = BuildCommand(prompt, session_id);
    logger_.Log({aide::utils::LogLevel::kInfo,
                 session_id.empty() ? "starting fresh agent session" : "resuming agent session",
                 {{"session", session_id.empty() ? "(new)" : session_id},
                  {"prompt_chars", std::to_string(prompt.size())}}});
    const auto started = std::chrono::steady_clock::now();
    const auto exec = aide::exec::CommandRunner::Run(
        command, root_, std::chrono::seconds(config_.timeout_s));
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);

    auto result = Classify(exec, session_id);
    logger_.Log({result.success ? aide::utils::LogLevel::kInfo : aide::utils::LogLevel::kWarn,
                 result.success ? "agent run finished" : "agent run failed",
                 {{"exit_code", std::to_string(exec.exit_code)},
                  {"elapsed_s", std::to_string(elapsed.count())},
                  {"session", result.session_id.empty() ? "(none)" : result.session_id}}});
    return result;
}

AgentRunResult AgentClient::Classify(const aide::exec::ExecResult& exec,
                                     const std::string& session_id) const {
    AgentRunResult result{};
    if (exec.not_found) {
        result.failure = AgentFailure::kLaunchFailed;
        result.message = "Failed to run the agent: executable not found (" + config_.bin + ")";
        return result;
    }
    if (exec.timed_out) {
        result.failure = AgentFailure::kTimeout;
        result.message = "The agent timed out after " + std::to_string(config_.timeout_s) + " s.";
        result.session_id = session_id;
        return result;
    }

    const auto events = ParseEventStream(exec.output);
    result.session_id = events.session_id.empty() ? session_id : events.session_id;
    if (exec.exit_code == 0) {
        result.success = true;
        result.message = SuccessText(events);
        return result;
    }
    result.failure = AgentFailure::kNonZeroExit;
    result.message = FailureText(exec.output, exec.error);
    return result;
}

ParsedEvents AgentClient::ParseEventStream(const std::string& stdout_text) {
    ParsedEvents events{};
    for (const auto& line : aide::utils::SplitLines(stdout_text)) {
        const auto trimmed = aide::utils::Trim(line);
        if (trimmed.empty()) {
            continue;
        }
        const auto json = nlohmann::json::parse(trimmed, nullptr, false);
        if (!json.is_object()) {
            events.raw_lines.push_back(trimmed);
            continue;
        }
        const auto type = GetString(json, "type");
        if (type == "thread.started") {
            if (events.session_id.empty()) {
                events.session_id = GetString(json, "thread_id");
            }
            continue;
        }
        if (type != "item.completed") {
            continue;
        }
        auto item = json.find("item");
        if (item == json.end() || !item->is_object()) {
            continue;
        }
        if (GetString(*item, "type") == "agent_message") {
            events.message = GetString(*item, "text");
        }
    }
    return events;
}

std::vector<std::string> AgentClient::NonJsonLines(const std::string& text, std::size_t limit) {
    std::vector<std::string> lines;
    for (const auto& line : aide::utils::SplitLines(text)) {
        const auto trimmed = aide::utils::Trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (nlohmann::json::parse(trimmed, nullptr, false).is_object()) {
            continue;
        }
        lines.push_back(trimmed);
    }
    if (lines.size() > limit) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return lines;
}

std::string AgentClient::SuccessText(const ParsedEvents& events) {
    const auto message = aide::utils::Trim(events.message);
    if (!message.empty()) {
        return message;
    }
    if (!events.raw_lines.empty()) {
        auto lines = events.raw_lines;
        if (lines.size() > kMaxDiagnosticLines) {
            lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(kMaxDiagnosticLines));
        }
        return aide::utils::Join(lines, "\n");
    }
    return kNoTextAnswer;
}

std::string AgentClient::FailureText(const std::string& stdout_text, const std::string& stderr_text) {
    auto details = NonJsonLines(stderr_text, kMaxDiagnosticLines);
    const auto stdout_lines = NonJsonLines(stdout_text, kMaxDiagnosticLines);
    details.insert(details.end(), stdout_lines.begin(), stdout_lines.end());
    if (details.empty()) {
        return kFailureNoDetails;
    }
    return std::string(kFailureHeader) + "\n\n" + aide::utils::Join(details, "\n");
}

}  // namespace aide::agent
