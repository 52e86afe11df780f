#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/mobile_errors.hpp"

namespace mobilemcp::process {

struct CommandSpec {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::uint32_t timeout_ms = 30000;
};

struct CommandOutput {
    int exit_code = -1;
    bool timed_out = false;
    bool launch_failed = false;  // binary missing or not executable
    std::string stdout_text;     // raw bytes; screenshots are binary
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Seam between the drivers and the operating system. Tests substitute a scripted fake.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Only infrastructure failures (pipe/fork) are errors; a nonzero exit is a normal output.
    virtual core::errors::Result<CommandOutput> run(const CommandSpec& spec) const = 0;
};

std::string describe(const CommandSpec& spec);

}  // namespace mobilemcp::process
