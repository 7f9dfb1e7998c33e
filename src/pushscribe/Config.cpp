// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <input/HotkeyCombo.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace pushscribe
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/pushscribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/pushscribe";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content, "Config");
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto const level = log::parseLevel(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", levelName));
    config.logLevel = *level;

    // Hotkey section
    if (auto const* hotkey = json::findObject(root, "hotkey"))
    {
        config.hotkey.combo = json::getStringOr(*hotkey, "combo", config.hotkey.combo);
        config.hotkey.cancelKey = json::getStringOr(*hotkey, "cancelKey", config.hotkey.cancelKey);
    }
    if (auto combo = HotkeyCombo::parse(config.hotkey.combo); !combo)
        return makeError(ErrorCode::ConfigError, combo.error().message);
    if (!config.hotkey.cancelKey.empty())
        if (auto cancel = HotkeyCombo::parse(config.hotkey.cancelKey); !cancel)
            return makeError(ErrorCode::ConfigError, cancel.error().message);

    // Audio section
    if (auto const* audio = json::findObject(root, "audio"))
    {
        config.audio.deviceName = json::getStringOr(*audio, "deviceName", "");
        config.audio.silenceThresholdDb =
            json::getFloatOr(*audio, "silenceThresholdDb", config.audio.silenceThresholdDb);
        if (config.audio.silenceThresholdDb > 0.0f)
            return makeError(ErrorCode::ConfigError, "audio.silenceThresholdDb must be at most 0 dBFS");
        config.audio.minSilenceMs = json::getIntOr(*audio, "minSilenceMs", config.audio.minSilenceMs);
        if (config.audio.minSilenceMs < 0)
            return makeError(ErrorCode::ConfigError, "audio.minSilenceMs must not be negative");
    }

    // Transcription section
    if (auto const* transcription = json::findObject(root, "transcription"))
    {
        auto const code = json::getStringOr(*transcription, "language", "en-US");
        auto const language = parseLanguage(code);
        if (!language)
            return makeError(ErrorCode::ConfigError, std::format("Unsupported language '{}'", code));
        config.transcription.language = *language;
        config.transcription.model = json::getStringOr(*transcription, "model", config.transcription.model);
        config.transcription.endpoint =
            json::getStringOr(*transcription, "endpoint", config.transcription.endpoint);
        config.transcription.timeoutMs = json::getIntOr(*transcription, "timeoutMs", 0);
        config.transcription.maxRetries = json::getIntOr(*transcription, "maxRetries", 0);
        config.transcription.retryDelayMs =
            json::getIntOr(*transcription, "retryDelayMs", config.transcription.retryDelayMs);
    }

    // Post-processing section
    if (auto const* postProcessing = json::findObject(root, "postProcessing"))
    {
        config.postProcessing.instruction = json::getStringOr(*postProcessing, "instruction", "");
        config.postProcessing.model = json::getStringOr(*postProcessing, "model", config.postProcessing.model);
        config.postProcessing.endpoint =
            json::getStringOr(*postProcessing, "endpoint", config.postProcessing.endpoint);
        config.postProcessing.timeoutMs = json::getIntOr(*postProcessing, "timeoutMs", 0);
    }

    // Output section
    if (auto const* output = json::findObject(root, "output"))
    {
        auto const methodName = json::getStringOr(*output, "method", "paste");
        auto const method = parseOutputMethod(methodName);
        if (!method)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown output method '{}' (expected paste or type)", methodName));
        config.output.method = *method;

        auto const backendName = json::getStringOr(*output, "backend", "auto");
        auto const backend = parseOutputBackend(backendName);
        if (!backend)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown output backend '{}' (expected auto, x11 or wayland)", backendName));
        config.output.backend = *backend;

        config.output.restoreClipboard = json::getBoolOr(*output, "restoreClipboard", true);
        config.output.pasteDelayMs = json::getIntOr(*output, "pasteDelayMs", config.output.pasteDelayMs);
        config.output.restoreDelayMs = json::getIntOr(*output, "restoreDelayMs", config.output.restoreDelayMs);
    }

    if (config.transcription.timeoutMs < 0 || config.postProcessing.timeoutMs < 0
        || config.transcription.maxRetries < 0 || config.output.pasteDelayMs < 0 || config.output.restoreDelayMs < 0)
        return makeError(ErrorCode::ConfigError, "Timeouts, delays and retry counts must not be negative");

    return config;
}

auto applyOverrides(AppConfig& config, const ConfigOverrides& overrides) -> VoidResult
{
    auto updated = config;

    if (overrides.hotkey)
    {
        if (auto combo = HotkeyCombo::parse(*overrides.hotkey); !combo)
            return makeError(ErrorCode::ConfigError, combo.error().message);
        updated.hotkey.combo = *overrides.hotkey;
    }

    if (overrides.language)
    {
        auto const language = parseLanguage(*overrides.language);
        if (!language)
            return makeError(ErrorCode::ConfigError, std::format("Unsupported language '{}'", *overrides.language));
        updated.transcription.language = *language;
    }

    if (overrides.instruction)
        updated.postProcessing.instruction = *overrides.instruction;

    if (overrides.outputMethod)
    {
        auto const method = parseOutputMethod(*overrides.outputMethod);
        if (!method)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown output method '{}' (expected paste or type)", *overrides.outputMethod));
        updated.output.method = *method;
    }

    if (overrides.silenceThresholdDb)
    {
        if (*overrides.silenceThresholdDb > 0.0f)
            return makeError(ErrorCode::ConfigError, "Silence threshold must be at most 0 dBFS");
        updated.audio.silenceThresholdDb = *overrides.silenceThresholdDb;
    }

    if (overrides.deviceName)
        updated.audio.deviceName = *overrides.deviceName;

    if (overrides.logLevel)
        updated.logLevel = *overrides.logLevel;

    config = std::move(updated);
    return {};
}

auto pipelineSettings(const AppConfig& config) -> PipelineSettings
{
    return PipelineSettings {
        .silenceThresholdDb = config.audio.silenceThresholdDb,
        .minSilence = std::chrono::milliseconds(config.audio.minSilenceMs),
        .language = config.transcription.language,
        .instruction = PostProcessInstruction { .prompt = config.postProcessing.instruction },
        .transcriptionTimeout = std::chrono::milliseconds(config.transcription.timeoutMs),
        .postProcessingTimeout = std::chrono::milliseconds(config.postProcessing.timeoutMs),
    };
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = std::string(log::levelName(config.logLevel));

    root["hotkey"] = {
        { "combo", config.hotkey.combo },
        { "cancelKey", config.hotkey.cancelKey },
    };

    root["audio"] = {
        { "deviceName", config.audio.deviceName },
        { "silenceThresholdDb", config.audio.silenceThresholdDb },
        { "minSilenceMs", config.audio.minSilenceMs },
    };

    root["transcription"] = {
        { "language", std::string(languageCode(config.transcription.language)) },
        { "model", config.transcription.model },
        { "endpoint", config.transcription.endpoint },
        { "timeoutMs", config.transcription.timeoutMs },
        { "maxRetries", config.transcription.maxRetries },
        { "retryDelayMs", config.transcription.retryDelayMs },
    };

    root["postProcessing"] = {
        { "instruction", config.postProcessing.instruction },
        { "model", config.postProcessing.model },
        { "endpoint", config.postProcessing.endpoint },
        { "timeoutMs", config.postProcessing.timeoutMs },
    };

    root["output"] = {
        { "method", std::string(outputMethodName(config.output.method)) },
        { "backend", std::string(outputBackendName(config.output.backend)) },
        { "restoreClipboard", config.output.restoreClipboard },
        { "pasteDelayMs", config.output.pasteDelayMs },
        { "restoreDelayMs", config.output.restoreDelayMs },
    };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace pushscribe
