// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <output/OutputInjector.hpp>
#include <pipeline/PipelineState.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Hotkey configuration section.
struct HotkeyConfig
{
    std::string combo = "ctrl+'";

    /// @brief Key that cancels an active run. Empty disables it.
    std::string cancelKey = "Escape";
};

/// @brief Audio configuration section.
struct AudioConfig
{
    std::string deviceName;
    float silenceThresholdDb = -50.0f;
    int minSilenceMs = 300;
};

/// @brief Speech-to-text configuration section.
struct TranscriptionConfig
{
    Language language = Language::EnglishUS;
    std::string model = "latest_short";
    std::string endpoint = "https://speech.googleapis.com";
    int timeoutMs = 0;
    int maxRetries = 0;
    int retryDelayMs = 500;
};

/// @brief Transcript rewriting configuration section.
struct PostProcessingConfig
{
    std::string instruction;
    std::string model = "gemini-2.0-flash";
    std::string endpoint = "https://generativelanguage.googleapis.com";
    int timeoutMs = 0;
};

/// @brief Text delivery configuration section.
struct OutputConfig
{
    OutputMethod method = OutputMethod::Paste;
    OutputBackend backend = OutputBackend::Auto;
    bool restoreClipboard = true;
    int pasteDelayMs = 50;
    int restoreDelayMs = 150;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;
    HotkeyConfig hotkey;
    AudioConfig audio;
    TranscriptionConfig transcription;
    PostProcessingConfig postProcessing;
    OutputConfig output;
};

/// @brief Command-line values that take precedence over the config file.
struct ConfigOverrides
{
    std::optional<std::string> hotkey;
    std::optional<std::string> language;
    std::optional<std::string> instruction;
    std::optional<std::string> outputMethod;
    std::optional<float> silenceThresholdDb;
    std::optional<std::string> deviceName;
    std::optional<log::Level> logLevel;
};

/// @brief Applies command-line overrides on top of a loaded configuration.
/// @return Success, or a ConfigError naming the first invalid value. The config is unchanged on error.
[[nodiscard]] auto applyOverrides(AppConfig& config, const ConfigOverrides& overrides) -> VoidResult;

/// @brief Derives the per-run pipeline settings from the configuration.
[[nodiscard]] auto pipelineSettings(const AppConfig& config) -> PipelineSettings;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration, or ConfigError for unreadable files and invalid values.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing fields keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the complete application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or a ConfigError.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory: $XDG_CONFIG_HOME/pushscribe or ~/.config/pushscribe.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace pushscribe
