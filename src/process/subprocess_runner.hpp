#pragma once

#include "process/command_runner.hpp"

namespace mobilemcp::process {

// fork/execvp runner: no shell, stdout and stderr captured through pipes,
// SIGKILL once spec.timeout_ms elapses.
class SubprocessRunner : public CommandRunner {
public:
    core::errors::Result<CommandOutput> run(const CommandSpec& spec) const override;
};

}  // namespace mobilemcp::process
