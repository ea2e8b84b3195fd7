#pragma once

#include "backup/command_runner.hpp"

namespace profprune {

/// POSIX CommandRunner: fork/execv with stdin from /dev/null and
/// stdout/stderr captured through pipes, then waitpid.
class ProcessRunner : public CommandRunner {
public:
    std::optional<std::string> locate(const std::string& program) const override;

    /// Throws std::system_error if the process cannot be spawned.
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args) override;
};

} // namespace profprune
