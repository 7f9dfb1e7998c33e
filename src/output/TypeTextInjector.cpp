// SPDX-License-Identifier: Apache-2.0
#include "TypeTextInjector.hpp"

#include <core/Log.hpp>

#include <format>

namespace pushscribe
{

TypeTextInjector::TypeTextInjector(CommandRunner& runner, OutputBackend backend): _runner(runner), _backend(backend)
{
}

auto TypeTextInjector::deliver(const std::string& text) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto command = _backend == OutputBackend::Wayland
                       ? Command { .program = "wtype", .args = { "--", text } }
                       : Command { .program = "xdotool", .args = { "type", "--clearmodifiers", "--", text } };
    // Typing speed is bounded by the tool's per-key delay
    command.timeout = std::chrono::milliseconds(5000 + 20 * static_cast<long>(text.size()));

    auto output = _runner.run(command);
    if (!output)
        return makeError(ErrorCode::InjectionFailed, output.error().message);
    if (!output->succeeded())
        return makeError(ErrorCode::InjectionFailed,
                         std::format("'{}' exited with code {}", command.program, output->exitCode));

    log::debug("Typed {} characters via {}", text.size(), outputBackendName(_backend));
    return {};
}

} // namespace pushscribe
