// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MicrophoneCapture.hpp>
#include <core/Log.hpp>
#include <input/X11HotkeyWatcher.hpp>
#include <output/ClipboardPasteInjector.hpp>
#include <output/SpawnCommandRunner.hpp>
#include <output/TypeTextInjector.hpp>
#include <pipeline/FeedbackDispatcher.hpp>
#include <pipeline/PipelineController.hpp>
#include <pipeline/PipelineLoop.hpp>
#include <pipeline/ThreadExecutor.hpp>
#include <pushscribe/ConsoleFeedback.hpp>
#include <remote/CurlHttpTransport.hpp>
#include <remote/GeminiPostProcessor.hpp>
#include <remote/GoogleSpeechTranscriber.hpp>
#include <remote/RetryingTranscriptionService.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <optional>
#include <print>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace pushscribe
{

namespace
{
    // Write end of the self-pipe used by the signal handler.
    int gSignalPipe = -1; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void signalHandler(int sig)
    {
        auto const savedErrno = errno;
        auto const byte = static_cast<unsigned char>(sig);
        [[maybe_unused]] auto const written = ::write(gSignalPipe, &byte, 1);
        errno = savedErrno;
    }

    constexpr auto HandledSignals = std::array { SIGINT, SIGTERM, SIGHUP };

    auto environmentLookup(std::string_view name) -> std::optional<std::string>
    {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    }

    auto optionalCancelCombo(const std::string& cancelKey) -> std::optional<HotkeyCombo>
    {
        if (cancelKey.empty())
            return std::nullopt;
        auto combo = HotkeyCombo::parse(cancelKey);
        if (!combo)
            return std::nullopt;
        return *combo;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::string configPath;
    ConfigOverrides overrides;

    SpawnCommandRunner runner;
    CurlHttpTransport transport;
    MicrophoneCapture capture;
    std::unique_ptr<GoogleSpeechTranscriber> speech;
    std::unique_ptr<RetryingTranscriptionService> retryingSpeech;
    std::unique_ptr<GeminiPostProcessor> rewriter;
    std::unique_ptr<OutputInjector> injector;

    PipelineLoop loop;
    ThreadExecutor executor;
    std::unique_ptr<X11HotkeyWatcher> watcher;
    std::unique_ptr<ConsoleFeedback> console;
    std::unique_ptr<CallbackFeedback> cancelArming;
    FeedbackDispatcher feedback;
    std::unique_ptr<PipelineController> controller;

    std::array<int, 2> signalPipe { -1, -1 };
    std::array<struct sigaction, HandledSignals.size()> previousActions {};
    bool signalsInstalled = false;
    bool running = false;

    Impl(AppConfig c, std::string path, ConfigOverrides o):
        config(std::move(c)), configPath(std::move(path)), overrides(std::move(o))
    {
    }

    ~Impl()
    {
        shutdown();
        restoreSignals();
    }

    [[nodiscard]] auto transcriber() -> TranscriptionService&
    {
        if (retryingSpeech)
            return *retryingSpeech;
        return *speech;
    }

    auto createServices() -> VoidResult
    {
        auto credentials = Credentials::fromEnvironment();
        if (credentials.empty())
            log::warning(
                "No credentials found. Set PUSHSCRIBE_API_KEY, GOOGLE_API_KEY or GOOGLE_OAUTH_ACCESS_TOKEN.");

        speech = std::make_unique<GoogleSpeechTranscriber>(
            transport,
            credentials,
            GoogleSpeechConfig {
                .endpoint = config.transcription.endpoint,
                .model = config.transcription.model,
                .requestTimeout = std::chrono::milliseconds(config.transcription.timeoutMs),
            });

        if (config.transcription.maxRetries > 0)
            retryingSpeech = std::make_unique<RetryingTranscriptionService>(
                *speech,
                RetryConfig {
                    .maxRetries = config.transcription.maxRetries,
                    .initialDelay = std::chrono::milliseconds(config.transcription.retryDelayMs),
                });

        rewriter = std::make_unique<GeminiPostProcessor>(
            transport,
            std::move(credentials),
            GeminiConfig {
                .endpoint = config.postProcessing.endpoint,
                .model = config.postProcessing.model,
                .requestTimeout = std::chrono::milliseconds(config.postProcessing.timeoutMs),
            });

        auto backend = resolveOutputBackend(config.output.backend, environmentLookup);
        if (!backend)
            return std::unexpected(backend.error());
        log::info("Output: {} via {}", outputMethodName(config.output.method), outputBackendName(*backend));

        switch (config.output.method)
        {
            case OutputMethod::Paste:
                injector = std::make_unique<ClipboardPasteInjector>(
                    runner,
                    *backend,
                    PasteOptions {
                        .restoreClipboard = config.output.restoreClipboard,
                        .pasteDelay = std::chrono::milliseconds(config.output.pasteDelayMs),
                        .restoreDelay = std::chrono::milliseconds(config.output.restoreDelayMs),
                    });
                break;
            case OutputMethod::Type: injector = std::make_unique<TypeTextInjector>(runner, *backend); break;
        }
        return {};
    }

    auto installSignals() -> VoidResult
    {
        if (::pipe2(signalPipe.data(), O_CLOEXEC | O_NONBLOCK) == -1)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create signal pipe: {}", std::strerror(errno)));
        gSignalPipe = signalPipe[1];

        struct sigaction sa {};
        sa.sa_handler = signalHandler;
        sa.sa_flags = SA_RESTART;
        sigemptyset(&sa.sa_mask);
        for (auto i = std::size_t { 0 }; i < HandledSignals.size(); ++i)
            sigaction(HandledSignals[i], &sa, &previousActions[i]);
        signalsInstalled = true;
        return {};
    }

    void restoreSignals()
    {
        if (signalsInstalled)
        {
            for (auto i = std::size_t { 0 }; i < HandledSignals.size(); ++i)
                sigaction(HandledSignals[i], &previousActions[i], nullptr);
            signalsInstalled = false;
        }
        gSignalPipe = -1;
        for (auto& fd: signalPipe)
        {
            if (fd != -1)
                ::close(fd);
            fd = -1;
        }
    }

    /// @brief Re-reads the config file and applies what can change at runtime.
    ///
    /// Hotkey, language, silence trimming, instruction, timeouts and log level
    /// take effect for the next run. Services and output backend keep their
    /// startup configuration.
    void reload()
    {
        auto loaded = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
        if (!loaded)
        {
            log::error("Reload failed, keeping current settings: {}", loaded.error());
            return;
        }
        if (auto applied = applyOverrides(*loaded, overrides); !applied)
        {
            log::error("Reload failed, keeping current settings: {}", applied.error());
            return;
        }

        auto combo = HotkeyCombo::parse(loaded->hotkey.combo);
        if (!combo)
        {
            log::error("Reload failed, keeping current settings: {}", combo.error());
            return;
        }

        if (loaded->hotkey.combo != config.hotkey.combo)
        {
            log::info("Hotkey changed to {}", combo->toString());
            watcher->setHotkey(*combo);
        }
        if (loaded->hotkey.cancelKey != config.hotkey.cancelKey)
            log::warning("Changing the cancel key requires a restart");

        log::setLevel(loaded->logLevel);
        loop.post(SettingsChanged { .settings = pipelineSettings(*loaded) });
        config = std::move(*loaded);
        log::info("Configuration reloaded");
    }

    void shutdown()
    {
        if (!running)
            return;
        running = false;

        loop.stop();
        if (controller)
            controller->abandonActiveRun();
        // Sinks arm and disarm the cancel key, so they go quiet before the watcher stops
        feedback.shutdown();
        if (watcher)
            watcher->stop();
        log::setCallback({});
    }
};

App::App(AppConfig config, std::string configPath, ConfigOverrides overrides):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath), std::move(overrides)))
{
}

App::~App()
{
    log::setCallback({});
}

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;
    log::setLevel(impl.config.logLevel);

    auto combo = HotkeyCombo::parse(impl.config.hotkey.combo);
    if (!combo)
        return std::unexpected(combo.error());

    if (auto result = impl.capture.initialize(impl.config.audio.deviceName); !result)
        log::warning("Microphone unavailable, recording will fail until restart: {}", result.error());

    if (auto result = impl.createServices(); !result)
        return result;

    auto const cancelCombo = optionalCancelCombo(impl.config.hotkey.cancelKey);
    impl.watcher = std::make_unique<X11HotkeyWatcher>(*combo, cancelCombo);

    impl.console = std::make_unique<ConsoleFeedback>(impl.capture);
    log::setCallback([console = impl.console.get()](log::Level level, std::string_view message) {
        console->printLog(level, message);
    });
    impl.cancelArming = std::make_unique<CallbackFeedback>([watcher = impl.watcher.get()](const FeedbackEvent& event) {
        if (event.kind == FeedbackKind::RecordingStarted)
            watcher->setCancelArmed(true);
        else if (event.isTerminal())
            watcher->setCancelArmed(false);
    });
    impl.feedback.addSink(*impl.console);
    impl.feedback.addSink(*impl.cancelArming);

    impl.controller = std::make_unique<PipelineController>(impl.capture,
                                                           impl.transcriber(),
                                                           *impl.rewriter,
                                                           *impl.injector,
                                                           impl.feedback,
                                                           impl.loop,
                                                           impl.executor,
                                                           pipelineSettings(impl.config));

    if (auto result = impl.installSignals(); !result)
        return result;

    impl.loop.start([controller = impl.controller.get()](PipelineEvent event) { controller->handle(std::move(event)); });
    impl.running = true;

    if (auto result = impl.watcher->observe([loop = &impl.loop](HotkeyEvent event) { loop->post(event); }); !result)
    {
        impl.shutdown();
        return result;
    }

    log::info("pushscribe initialized");
    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;

    std::println("pushscribe: hold {} to dictate{}, Ctrl+C to quit",
                 impl.config.hotkey.combo,
                 impl.config.hotkey.cancelKey.empty() ? std::string {}
                                                      : std::format(", {} to cancel", impl.config.hotkey.cancelKey));
    std::println("Language: {}", languageDisplayName(impl.config.transcription.language));
    if (!impl.config.postProcessing.instruction.empty())
        std::println("Instruction: {}", impl.config.postProcessing.instruction);

    auto exitCode = 0;
    auto quit = false;
    while (!quit)
    {
        auto pfd = pollfd { .fd = impl.signalPipe[0], .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, -1);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("poll() failed: {}", std::strerror(errno));
            exitCode = 1;
            break;
        }

        auto sig = static_cast<unsigned char>(0);
        while (::read(impl.signalPipe[0], &sig, 1) == 1)
        {
            if (sig == SIGHUP)
            {
                impl.reload();
                continue;
            }
            log::info("Received signal {}, shutting down", static_cast<int>(sig));
            quit = true;
            break;
        }
    }

    impl.shutdown();
    return exitCode;
}

} // namespace pushscribe
