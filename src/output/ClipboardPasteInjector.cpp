// SPDX-License-Identifier: Apache-2.0
#include "ClipboardPasteInjector.hpp"

#include <core/Log.hpp>

#include <format>
#include <thread>

namespace pushscribe
{

namespace
{

    auto runChecked(CommandRunner& runner, const Command& command) -> Result<CommandOutput>
    {
        auto output = runner.run(command);
        if (!output)
            return makeError(ErrorCode::InjectionFailed, output.error().message);
        if (!output->succeeded())
            return makeError(ErrorCode::InjectionFailed,
                             std::format("'{}' exited with code {}", describeCommand(command), output->exitCode));
        return output;
    }

} // namespace

ClipboardPasteInjector::ClipboardPasteInjector(CommandRunner& runner, OutputBackend backend, PasteOptions options):
    _runner(runner), _backend(backend), _options(options)
{
}

auto ClipboardPasteInjector::readClipboard() -> std::optional<std::string>
{
    auto command = _backend == OutputBackend::Wayland
                       ? Command { .program = "wl-paste", .args = { "-n" }, .input = {}, .captureOutput = true }
                       : Command { .program = "xclip",
                                   .args = { "-selection", "clipboard", "-o" },
                                   .input = {},
                                   .captureOutput = true };

    // An empty or non-text clipboard makes these tools fail; there is simply nothing to restore then
    auto output = _runner.run(command);
    if (!output || !output->succeeded())
        return std::nullopt;
    return std::move(output->output);
}

auto ClipboardPasteInjector::writeClipboard(const std::string& text) -> VoidResult
{
    auto command = _backend == OutputBackend::Wayland
                       ? Command { .program = "wl-copy", .args = {}, .input = text }
                       : Command { .program = "xclip", .args = { "-selection", "clipboard" }, .input = text };

    auto output = runChecked(_runner, command);
    if (!output)
        return std::unexpected(output.error());
    return {};
}

auto ClipboardPasteInjector::sendPaste() -> VoidResult
{
    auto command = _backend == OutputBackend::Wayland
                       ? Command { .program = "wtype", .args = { "-M", "ctrl", "v", "-m", "ctrl" } }
                       : Command { .program = "xdotool", .args = { "key", "--clearmodifiers", "ctrl+v" } };

    auto output = runChecked(_runner, command);
    if (!output)
        return std::unexpected(output.error());
    return {};
}

auto ClipboardPasteInjector::deliver(const std::string& text) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto const saved = _options.restoreClipboard ? readClipboard() : std::nullopt;

    if (auto written = writeClipboard(text); !written)
        return makeError(ErrorCode::InjectionFailed,
                         std::format("Cannot write clipboard: {}", written.error().message));

    std::this_thread::sleep_for(_options.pasteDelay);

    if (auto pasted = sendPaste(); !pasted)
        return makeError(ErrorCode::InjectionFailed,
                         std::format("Paste keystroke failed, text left on the clipboard: {}", pasted.error().message));

    if (saved)
    {
        std::this_thread::sleep_for(_options.restoreDelay);
        if (auto restored = writeClipboard(*saved); !restored)
            log::warning("Could not restore previous clipboard: {}", restored.error().message);
    }

    log::debug("Pasted {} characters via {}", text.size(), outputBackendName(_backend));
    return {};
}

} // namespace pushscribe
