#pragma once

#include <optional>
#include <string>
#include <vector>

namespace profprune {

/// Outcome of one synchronous external command.
struct CommandResult {
    int exit_code = -1;      // process exit status, -1 if it never ran
    bool signaled = false;   // terminated by a signal
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return !signaled && exit_code == 0; }
};

// ─── Command Runner ────────────────────────────────────────────
// Port for running an external tool and waiting for it to exit.
// No timeout: run() blocks until the process is gone.

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Resolve a program name to an executable path, or nullopt.
    virtual std::optional<std::string> locate(const std::string& program) const = 0;

    /// Run program with args, capturing its output.
    virtual CommandResult run(const std::string& program,
                              const std::vector<std::string>& args) = 0;
};

} // namespace profprune
