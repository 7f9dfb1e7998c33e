// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <pushscribe/App.hpp>
#include <pushscribe/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "pushscribe: push-to-talk dictation into the focused window" };

    auto configPath = std::string {};
    auto hotkey = std::string {};
    auto language = std::string {};
    auto instruction = std::string {};
    auto outputMethod = std::string {};
    auto thresholdDb = 0.0f;
    auto deviceName = std::string {};
    auto verbose = false;
    auto listLanguages = false;
    auto resetConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--hotkey", hotkey, "Push-to-talk key combination, e.g. \"ctrl+'\" or \"super+space\"");
    app.add_option("-l,--language", language, "Transcription language code, e.g. en-US");
    app.add_option("-i,--instruction", instruction, "Rewrite instruction applied to every transcript");
    app.add_option("-o,--output", outputMethod, "Output method (paste|type)");
    auto* thresholdOption = app.add_option("--threshold-db", thresholdDb, "Silence threshold in dBFS");
    app.add_option("-d,--device", deviceName, "Capture device name (substring match)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--list-languages", listLanguages, "List supported languages and exit");
    app.add_flag("--reset-config", resetConfig, "Overwrite the config file with defaults and exit");

    CLI11_PARSE(app, argc, argv);

    if (listLanguages)
    {
        for (auto const& info: pushscribe::supportedLanguages())
            std::println("{:8} {}", info.code, info.displayName);
        return 0;
    }

    if (resetConfig)
    {
        auto const path = configPath.empty() ? pushscribe::defaultConfigPath() : configPath;
        if (auto result = pushscribe::saveConfigToFile(path, pushscribe::AppConfig {}); !result)
        {
            pushscribe::log::error("Failed to reset config: {}", result.error().message);
            return 1;
        }
        std::println("Wrote default configuration to {}", path);
        return 0;
    }

    if (verbose)
        pushscribe::log::setLevel(pushscribe::log::Level::Debug);

    // Load config
    auto configResult = configPath.empty() ? pushscribe::loadConfig() : pushscribe::loadConfigFromFile(configPath);
    if (!configResult)
    {
        pushscribe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    auto overrides = pushscribe::ConfigOverrides {};
    if (!hotkey.empty())
        overrides.hotkey = hotkey;
    if (!language.empty())
        overrides.language = language;
    if (!instruction.empty())
        overrides.instruction = instruction;
    if (!outputMethod.empty())
        overrides.outputMethod = outputMethod;
    if (thresholdOption->count() > 0)
        overrides.silenceThresholdDb = thresholdDb;
    if (!deviceName.empty())
        overrides.deviceName = deviceName;
    if (verbose)
        overrides.logLevel = pushscribe::log::Level::Debug;

    if (auto result = pushscribe::applyOverrides(config, overrides); !result)
    {
        pushscribe::log::error("{}", result.error().message);
        return 1;
    }

    // Child processes may exit before reading all of their input.
    std::signal(SIGPIPE, SIG_IGN);

    auto application = pushscribe::App(std::move(config), std::move(configPath), std::move(overrides));
    auto initResult = application.initialize();
    if (!initResult)
    {
        pushscribe::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
