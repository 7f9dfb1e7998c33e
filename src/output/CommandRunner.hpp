// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace pushscribe
{

/// @brief An external program invocation.
struct Command
{
    std::string program; ///< Looked up in PATH.
    std::vector<std::string> args;
    std::string input;          ///< Written to the child's stdin, which is then closed.
    bool captureOutput = false; ///< When false, the child's stdout goes to /dev/null.
    std::chrono::milliseconds timeout { 5000 };
};

struct CommandOutput
{
    int exitCode = 0;
    std::string output;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return exitCode == 0; }
};

/// @brief Abstract runner for external desktop tools.
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /// @brief Runs a command to completion.
    /// @return The exit code and captured output, or ProcessError if the
    ///         program cannot be started or exceeds its timeout.
    [[nodiscard]] virtual auto run(const Command& command) -> Result<CommandOutput> = 0;
};

/// @brief Formats a command line for log messages.
[[nodiscard]] auto describeCommand(const Command& command) -> std::string;

} // namespace pushscribe
