#include "exec/command_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace aide::exec {
namespace bp = boost::process;

namespace {

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::filesystem::path TempCapturePath(const char* stream) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
           ("aide_" + std::string(stream) + "_" + std::to_string(::getpid()) + "_" + stamp + "_" +
            std::to_string(counter.fetch_add(1)) + ".log");
}

// Polls until the child exits or the deadline passes. Returns true when reaped.
bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds step, int& status) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(step);
    }
    return false;
}

}  // namespace

std::string CommandRunner::ResolveExecutable(const std::string& name) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    return bp::search_path(name).string();
}

ExecResult CommandRunner::Run(const std::vector<std::string>& argv,
                              const std::filesystem::path& working_dir,
                              std::chrono::seconds timeout) {
    ExecResult result{};
    if (argv.empty()) {
        result.not_found = true;
        result.error = "empty command";
        return result;
    }
    const auto executable = ResolveExecutable(argv.front());
    if (executable.empty()) {
        result.not_found = true;
        result.error = "executable not found: " + argv.front();
        return result;
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    const auto stdout_path = TempCapturePath("stdout");
    const auto stderr_path = TempCapturePath("stderr");

    try {
        bp::child child_process(
            executable,
            bp::args(args),
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        const pid_t pid = child_process.id();
        int status = 0;
        bool finished = WaitUntil(
            pid, std::chrono::steady_clock::now() + timeout, std::chrono::milliseconds(200), status);
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(
                pid,
                std::chrono::steady_clock::now() + std::chrono::seconds(2),
                std::chrono::milliseconds(100),
                status);
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.exit_code = 124;
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        result.not_found = true;
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    if (!result.not_found) {
        result.output = ReadAll(stdout_path);
        result.error = ReadAll(stderr_path);
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace aide::exec
