// SPDX-License-Identifier: Apache-2.0
#include "SpawnCommandRunner.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace pushscribe
{

namespace
{

    void closeFd(int& fd)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }

    auto remainingMs(std::chrono::steady_clock::time_point deadline) -> int
    {
        auto const left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    }

    void writeAll(int fd, const std::string& data)
    {
        auto offset = std::size_t { 0 };
        while (offset < data.size())
        {
            auto const n = ::write(fd, data.data() + offset, data.size() - offset);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                // The child closed its stdin early; it decides its own exit code
                log::debug("Short write to child stdin: {}", std::strerror(errno));
                return;
            }
            offset += static_cast<std::size_t>(n);
        }
    }

} // namespace

auto describeCommand(const Command& command) -> std::string
{
    auto text = command.program;
    for (auto const& arg: command.args)
    {
        text += ' ';
        text += arg;
    }
    return text;
}

auto SpawnCommandRunner::run(const Command& command) -> Result<CommandOutput>
{
    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };

    // Close-on-exec keeps these out of tools spawned concurrently by other threads
    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ProcessError, "Failed to create stdin pipe");
    if (command.captureOutput && pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        closeFd(stdinPipe[0]);
        closeFd(stdinPipe[1]);
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
    if (command.captureOutput)
    {
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);
        posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);
    }
    else
    {
        // Tools like xclip and wl-copy fork a daemon that would keep a stdout pipe open forever
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }

    // Build argv
    auto argv = std::vector<char*> {};
    auto programCopy = command.program;
    argv.push_back(programCopy.data());
    auto argCopies = std::vector<std::string>(command.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, command.program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);

    if (status != 0)
    {
        closeFd(stdinPipe[1]);
        closeFd(stdoutPipe[0]);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to start '{}': {}", command.program, std::strerror(status)));
    }

    log::trace("Spawned [{}] pid {}", describeCommand(command), pid);

    writeAll(stdinPipe[1], command.input);
    closeFd(stdinPipe[1]);

    auto const deadline = std::chrono::steady_clock::now() + command.timeout;
    auto result = CommandOutput {};
    auto timedOut = false;

    if (command.captureOutput)
    {
        auto buf = std::array<char, 4096> {};
        while (true)
        {
            auto fds = pollfd { .fd = stdoutPipe[0], .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&fds, 1, remainingMs(deadline));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready == 0)
            {
                timedOut = true;
                break;
            }
            if (ready < 0)
                break;

            auto const n = ::read(stdoutPipe[0], buf.data(), buf.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                break;
            result.output.append(buf.data(), static_cast<std::size_t>(n));
        }
        closeFd(stdoutPipe[0]);
    }

    auto waitStatus = 0;
    while (true)
    {
        if (timedOut)
        {
            kill(pid, SIGKILL);
            waitpid(pid, &waitStatus, 0);
            break;
        }

        auto const waited = waitpid(pid, &waitStatus, WNOHANG);
        if (waited == pid)
            break;
        if (waited < 0 && errno != EINTR)
            return makeError(ErrorCode::ProcessError,
                             std::format("waitpid failed for '{}': {}", command.program, std::strerror(errno)));

        if (std::chrono::steady_clock::now() >= deadline)
            timedOut = true;
        else
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (timedOut)
        return makeError(ErrorCode::ProcessError,
                         std::format("'{}' did not finish within {} ms", command.program, command.timeout.count()));

    if (WIFEXITED(waitStatus))
        result.exitCode = WEXITSTATUS(waitStatus);
    else if (WIFSIGNALED(waitStatus))
        result.exitCode = 128 + WTERMSIG(waitStatus);

    return result;
}

} // namespace pushscribe
