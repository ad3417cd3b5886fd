#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace aide::exec {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    // The executable could not be located or started; nothing ran.
    bool not_found = false;
    std::string output;
    std::string error;
};

class CommandRunner {
public:
    // argv[0] is looked up on PATH unless it contains a slash. The child gets an
    // empty stdin; stdout and stderr are captured separately. On timeout the child
    // receives SIGTERM, then SIGKILL after a short grace period.
    static ExecResult Run(const std::vector<std::string>& argv,
                          const std::filesystem::path& working_dir,
                          std::chrono::seconds timeout);

    static std::string ResolveExecutable(const std::string& name);
};

}  // namespace aide::exec
