// SPDX-License-Identifier: Apache-2.0
#include <output/ClipboardPasteInjector.hpp>
#include <output/SpawnCommandRunner.hpp>
#include <output/TypeTextInjector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace pushscribe;

namespace
{

/// @brief Records commands and answers them from a script, defaulting to success.
class FakeCommandRunner: public CommandRunner
{
  public:
    std::vector<Command> commands;
    std::deque<Result<CommandOutput>> replies;

    auto run(const Command& command) -> Result<CommandOutput> override
    {
        commands.push_back(command);
        if (replies.empty())
            return CommandOutput {};
        auto reply = std::move(replies.front());
        replies.pop_front();
        return reply;
    }

    [[nodiscard]] auto commandLines() const -> std::vector<std::string>
    {
        auto lines = std::vector<std::string> {};
        for (auto const& command: commands)
            lines.push_back(describeCommand(command));
        return lines;
    }
};

constexpr auto NoDelays = PasteOptions {
    .restoreClipboard = true,
    .pasteDelay = std::chrono::milliseconds(0),
    .restoreDelay = std::chrono::milliseconds(0),
};

auto lookupFrom(std::map<std::string, std::string> values) -> EnvironmentLookup
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        if (auto const it = values.find(std::string(name)); it != values.end())
            return it->second;
        return std::nullopt;
    };
}

} // namespace

// {{{ Backend selection

TEST_CASE("Output method and backend names parse case-insensitively", "[output]")
{
    CHECK(parseOutputMethod("paste") == OutputMethod::Paste);
    CHECK(parseOutputMethod(" Type ") == OutputMethod::Type);
    CHECK(!parseOutputMethod("clipboard").has_value());

    CHECK(parseOutputBackend("AUTO") == OutputBackend::Auto);
    CHECK(parseOutputBackend("x11") == OutputBackend::X11);
    CHECK(parseOutputBackend("wayland") == OutputBackend::Wayland);
    CHECK(!parseOutputBackend("quartz").has_value());
}

TEST_CASE("Automatic backend follows the session environment", "[output]")
{
    auto const wayland = resolveOutputBackend(OutputBackend::Auto,
                                              lookupFrom({ { "WAYLAND_DISPLAY", "wayland-0" }, { "DISPLAY", ":0" } }));
    REQUIRE(wayland);
    CHECK(*wayland == OutputBackend::Wayland);

    auto const x11 = resolveOutputBackend(OutputBackend::Auto, lookupFrom({ { "DISPLAY", ":1" } }));
    REQUIRE(x11);
    CHECK(*x11 == OutputBackend::X11);

    auto const none = resolveOutputBackend(OutputBackend::Auto, lookupFrom({}));
    REQUIRE(!none);
    CHECK(none.error().code == ErrorCode::InjectionFailed);

    auto const forced = resolveOutputBackend(OutputBackend::X11, lookupFrom({}));
    REQUIRE(forced);
    CHECK(*forced == OutputBackend::X11);
}

// }}}
// {{{ Clipboard paste

TEST_CASE("Paste saves, writes, pastes and restores the clipboard on X11", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 0, .output = "previous" });
    auto injector = ClipboardPasteInjector(runner, OutputBackend::X11, NoDelays);

    REQUIRE(injector.deliver("hello world"));

    CHECK(runner.commandLines()
          == std::vector<std::string> {
              "xclip -selection clipboard -o",
              "xclip -selection clipboard",
              "xdotool key --clearmodifiers ctrl+v",
              "xclip -selection clipboard",
          });
    CHECK(runner.commands[0].captureOutput);
    CHECK(runner.commands[1].input == "hello world");
    CHECK(runner.commands[3].input == "previous");
}

TEST_CASE("Paste uses the Wayland tools", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 0, .output = "old" });
    auto injector = ClipboardPasteInjector(runner, OutputBackend::Wayland, NoDelays);

    REQUIRE(injector.deliver("hallo"));

    CHECK(runner.commandLines()
          == std::vector<std::string> { "wl-paste -n", "wl-copy", "wtype -M ctrl v -m ctrl", "wl-copy" });
}

TEST_CASE("Unreadable clipboard is not restored", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 1, .output = "" });
    auto injector = ClipboardPasteInjector(runner, OutputBackend::X11, NoDelays);

    REQUIRE(injector.deliver("text"));
    CHECK(runner.commands.size() == 3);
}

TEST_CASE("Disabled restore skips reading the clipboard", "[output]")
{
    auto runner = FakeCommandRunner {};
    auto options = NoDelays;
    options.restoreClipboard = false;
    auto injector = ClipboardPasteInjector(runner, OutputBackend::X11, options);

    REQUIRE(injector.deliver("text"));
    CHECK(runner.commandLines()
          == std::vector<std::string> { "xclip -selection clipboard", "xdotool key --clearmodifiers ctrl+v" });
}

TEST_CASE("Failed paste keystroke leaves the text on the clipboard", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 0, .output = "previous" });
    runner.replies.push_back(CommandOutput {});
    runner.replies.push_back(makeError(ErrorCode::ProcessError, "Failed to start 'xdotool'"));
    auto injector = ClipboardPasteInjector(runner, OutputBackend::X11, NoDelays);

    auto const result = injector.deliver("hello");

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::InjectionFailed);
    CHECK(result.error().message.contains("left on the clipboard"));
    // No restore after a failed paste
    CHECK(runner.commands.size() == 3);
}

TEST_CASE("Failed clipboard write is an injection failure", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 0, .output = "previous" });
    runner.replies.push_back(CommandOutput { .exitCode = 1, .output = "" });
    auto injector = ClipboardPasteInjector(runner, OutputBackend::X11, NoDelays);

    auto const result = injector.deliver("hello");

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::InjectionFailed);
    CHECK(runner.commands.size() == 2);
}

// }}}
// {{{ Typing

TEST_CASE("Type passes the text as a single argument", "[output]")
{
    auto runner = FakeCommandRunner {};
    auto injector = TypeTextInjector(runner, OutputBackend::X11);

    REQUIRE(injector.deliver("-n looks like a flag"));

    REQUIRE(runner.commands.size() == 1);
    CHECK(runner.commands[0].program == "xdotool");
    CHECK(runner.commands[0].args
          == std::vector<std::string> { "type", "--clearmodifiers", "--", "-n looks like a flag" });
    CHECK(runner.commands[0].timeout > std::chrono::milliseconds(5000));
}

TEST_CASE("Type reports a failing tool", "[output]")
{
    auto runner = FakeCommandRunner {};
    runner.replies.push_back(CommandOutput { .exitCode = 2, .output = "" });
    auto injector = TypeTextInjector(runner, OutputBackend::Wayland);

    auto const result = injector.deliver("hi");

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::InjectionFailed);
    CHECK(runner.commands[0].program == "wtype");
}

// }}}
// {{{ Process runner

TEST_CASE("SpawnCommandRunner feeds stdin and captures stdout", "[output][process]")
{
    auto runner = SpawnCommandRunner {};
    auto const output = runner.run(Command {
        .program = "cat",
        .args = {},
        .input = "line one\nline two\n",
        .captureOutput = true,
    });

    REQUIRE(output);
    CHECK(output->succeeded());
    CHECK(output->output == "line one\nline two\n");
}

TEST_CASE("SpawnCommandRunner reports the exit code", "[output][process]")
{
    auto runner = SpawnCommandRunner {};
    auto const output = runner.run(Command { .program = "sh", .args = { "-c", "exit 3" } });

    REQUIRE(output);
    CHECK(output->exitCode == 3);
    CHECK(!output->succeeded());
}

TEST_CASE("SpawnCommandRunner fails for a missing program", "[output][process]")
{
    auto runner = SpawnCommandRunner {};
    auto const output = runner.run(Command { .program = "pushscribe-no-such-tool" });

    // posix_spawnp reports the failure either directly or as exit status 127
    if (output)
        CHECK(output->exitCode == 127);
    else
        CHECK(output.error().code == ErrorCode::ProcessError);
}

TEST_CASE("SpawnCommandRunner kills a command that exceeds its timeout", "[output][process]")
{
    auto runner = SpawnCommandRunner {};
    auto const started = std::chrono::steady_clock::now();
    auto const output = runner.run(Command {
        .program = "sleep",
        .args = { "5" },
        .input = {},
        .captureOutput = false,
        .timeout = std::chrono::milliseconds(200),
    });

    REQUIRE(!output);
    CHECK(output.error().code == ErrorCode::ProcessError);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
}

TEST_CASE("SpawnCommandRunner keeps its pipes out of concurrently spawned tools", "[output][process]")
{
    auto runner = SpawnCommandRunner {};
    auto const listDescriptors = [&] {
        auto const output = runner.run(Command {
            .program = "sh",
            .args = { "-c", "ls /proc/$$/fd" },
            .input = {},
            .captureOutput = true,
        });
        REQUIRE(output);
        return output->output;
    };

    auto const baseline = listDescriptors();

    // A capturing command holds its stdout pipe open in this process while it runs
    auto slow = std::jthread([&] {
        auto const output = runner.run(Command {
            .program = "sleep",
            .args = { "1" },
            .input = {},
            .captureOutput = true,
        });
        static_cast<void>(output);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CHECK(listDescriptors() == baseline);
}

// }}}
