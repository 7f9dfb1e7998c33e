// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pushscribe/Config.hpp>

#include <memory>
#include <string>

namespace pushscribe
{

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The effective configuration (file plus command-line overrides).
    /// @param configPath The file that SIGHUP reloads. Empty means the default path.
    /// @param overrides Command-line overrides, re-applied after every reload.
    App(AppConfig config, std::string configPath, ConfigOverrides overrides);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the microphone, resolves credentials and the output backend, and grabs the hotkey.
    /// @return Success, or the error that makes the application unusable.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs until SIGINT or SIGTERM.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
