// SPDX-License-Identifier: Apache-2.0
#include <output/ClipboardPasteInjector.hpp>
#include <pipeline/FeedbackDispatcher.hpp>
#include <pipeline/PipelineController.hpp>
#include <pipeline/PipelineLoop.hpp>
#include <pipeline/ThreadExecutor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace pushscribe;

using namespace std::chrono_literals;

namespace
{

/// @brief Collects values from another thread and lets the test wait for a count.
template <typename T>
class Collector
{
  public:
    void add(T value)
    {
        {
            auto lock = std::lock_guard(_mutex);
            _values.push_back(std::move(value));
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto waitFor(std::size_t count, std::chrono::milliseconds timeout = 2s) -> std::vector<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [&] { return _values.size() >= count; });
        return _values;
    }

  private:
    std::mutex _mutex;
    std::condition_variable _cv;
    std::vector<T> _values;
};

auto hotkey(HotkeyEvent::Kind kind) -> PipelineEvent
{
    return HotkeyEvent { .kind = kind };
}

auto kindOf(const PipelineEvent& event) -> HotkeyEvent::Kind
{
    return std::get<HotkeyEvent>(event).kind;
}

/// @brief Capture that returns half a second of loud audio and counts sessions across threads.
class LoudCapture: public AudioCapture
{
  public:
    Collector<int> starts;

    auto start() -> VoidResult override
    {
        _capturing = true;
        starts.add(++_startCount);
        return {};
    }

    auto stop() -> AudioBuffer override
    {
        _capturing = false;
        auto buffer = AudioBuffer {};
        buffer.samples.assign(CaptureSampleRate / 2, 0.5f);
        return buffer;
    }

    [[nodiscard]] auto isCapturing() const -> bool override { return _capturing; }
    [[nodiscard]] auto currentAmplitude() const -> float override { return 0.0f; }

  private:
    std::atomic<bool> _capturing { false };
    int _startCount = 0;
};

class InstantTranscriber: public TranscriptionService
{
  public:
    auto transcribe(const TranscriptRequest& /*request*/, std::stop_token /*stopToken*/)
        -> Result<std::string> override
    {
        return std::string("hello world");
    }
};

class UnusedPostProcessor: public PostProcessor
{
  protected:
    auto doRewrite(const std::string& text, const PostProcessInstruction& /*instruction*/, std::stop_token /*stopToken*/)
        -> Result<std::string> override
    {
        return text;
    }
};

/// @brief Desktop tools that always succeed; records every command line.
class SucceedingRunner: public CommandRunner
{
  public:
    Collector<std::string> commandLines;

    auto run(const Command& command) -> Result<CommandOutput> override
    {
        commandLines.add(describeCommand(command));
        return CommandOutput { .exitCode = 0, .output = command.captureOutput ? "previous" : "" };
    }
};

} // namespace

// {{{ PipelineLoop

TEST_CASE("PipelineLoop delivers posted events in order on its own thread", "[loop]")
{
    auto loop = PipelineLoop {};
    auto kinds = Collector<HotkeyEvent::Kind> {};
    auto threads = Collector<std::thread::id> {};

    loop.start([&](PipelineEvent event) {
        threads.add(std::this_thread::get_id());
        kinds.add(kindOf(event));
    });

    loop.post(hotkey(HotkeyEvent::Kind::Press));
    loop.post(hotkey(HotkeyEvent::Kind::Release));
    loop.post(hotkey(HotkeyEvent::Kind::Cancel));

    auto const received = kinds.waitFor(3);
    loop.stop();

    CHECK(received
          == std::vector { HotkeyEvent::Kind::Press, HotkeyEvent::Kind::Release, HotkeyEvent::Kind::Cancel });
    for (auto const id: threads.waitFor(3, 0ms))
        CHECK(id != std::this_thread::get_id());
}

TEST_CASE("PipelineLoop fires delayed events by due time", "[loop]")
{
    auto loop = PipelineLoop {};
    auto kinds = Collector<HotkeyEvent::Kind> {};
    loop.start([&](PipelineEvent event) { kinds.add(kindOf(event)); });

    auto const started = std::chrono::steady_clock::now();
    loop.postAfter(120ms, hotkey(HotkeyEvent::Kind::Cancel));
    loop.postAfter(40ms, hotkey(HotkeyEvent::Kind::Release));
    loop.post(hotkey(HotkeyEvent::Kind::Press));

    auto const received = kinds.waitFor(3);
    auto const elapsed = std::chrono::steady_clock::now() - started;
    loop.stop();

    CHECK(received
          == std::vector { HotkeyEvent::Kind::Press, HotkeyEvent::Kind::Release, HotkeyEvent::Kind::Cancel });
    CHECK(elapsed >= 120ms);
}

TEST_CASE("PipelineLoop drops pending timers on stop", "[loop]")
{
    auto loop = PipelineLoop {};
    auto kinds = Collector<HotkeyEvent::Kind> {};
    loop.start([&](PipelineEvent event) { kinds.add(kindOf(event)); });

    loop.postAfter(150ms, hotkey(HotkeyEvent::Kind::Press));
    loop.stop();

    CHECK(kinds.waitFor(1, 300ms).empty());
}

// }}}
// {{{ FeedbackDispatcher

TEST_CASE("FeedbackDispatcher fans out to every sink in order", "[feedback]")
{
    auto first = std::vector<FeedbackKind> {};
    auto second = std::vector<FeedbackKind> {};
    auto sinkA = CallbackFeedback([&](const FeedbackEvent& event) { first.push_back(event.kind); });
    auto sinkB = CallbackFeedback([&](const FeedbackEvent& event) { second.push_back(event.kind); });

    auto dispatcher = FeedbackDispatcher {};
    dispatcher.addSink(sinkA);
    dispatcher.addSink(sinkB);

    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::RecordingStarted, .runId = 1 });
    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::TranscribingStarted, .runId = 1 });
    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::Done, .runId = 1, .text = "hi" });
    dispatcher.flush();

    auto const expected =
        std::vector { FeedbackKind::RecordingStarted, FeedbackKind::TranscribingStarted, FeedbackKind::Done };
    CHECK(first == expected);
    CHECK(second == expected);
}

TEST_CASE("FeedbackDispatcher does not block the notifier on a slow sink", "[feedback]")
{
    auto release = std::atomic<bool> { false };
    auto delivered = std::atomic<int> { 0 };
    auto slow = CallbackFeedback([&](const FeedbackEvent&) {
        while (!release.load())
            std::this_thread::sleep_for(1ms);
        ++delivered;
    });

    auto dispatcher = FeedbackDispatcher {};
    dispatcher.addSink(slow);

    auto const started = std::chrono::steady_clock::now();
    for (auto i = 0; i < 5; ++i)
        dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::Warning });
    CHECK(std::chrono::steady_clock::now() - started < 500ms);
    CHECK(delivered.load() == 0);

    release = true;
    dispatcher.flush();
    CHECK(delivered.load() == 5);
}

TEST_CASE("FeedbackDispatcher delivers queued events on shutdown and ignores later ones", "[feedback]")
{
    auto count = std::atomic<int> { 0 };
    auto sink = CallbackFeedback([&](const FeedbackEvent&) { ++count; });

    auto dispatcher = FeedbackDispatcher {};
    dispatcher.addSink(sink);
    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::Cancelled });
    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::Cancelled });
    dispatcher.shutdown();
    CHECK(count.load() == 2);

    dispatcher.notify(FeedbackEvent { .kind = FeedbackKind::Cancelled });
    dispatcher.shutdown();
    CHECK(count.load() == 2);
}

// }}}
// {{{ ThreadExecutor

TEST_CASE("ThreadExecutor runs tasks concurrently", "[executor]")
{
    auto gate = std::atomic<bool> { false };
    auto started = Collector<int> {};
    auto finished = std::atomic<int> { 0 };

    {
        auto executor = ThreadExecutor {};
        for (auto i = 0; i < 3; ++i)
            executor.execute([&, i] {
                started.add(i);
                while (!gate.load())
                    std::this_thread::sleep_for(1ms);
                ++finished;
            });

        // All three are blocked at the same time
        CHECK(started.waitFor(3).size() == 3);
        CHECK(executor.activeCount() == 3);
        gate = true;
    }

    CHECK(finished.load() == 3);
}

TEST_CASE("ThreadExecutor survives a throwing task", "[executor]")
{
    auto ran = std::atomic<bool> { false };
    {
        auto executor = ThreadExecutor {};
        executor.execute([] { throw std::runtime_error("boom"); });
        executor.execute([&] { ran = true; });
    }
    CHECK(ran.load());
}

// }}}
// {{{ Pipeline on live threads

TEST_CASE("A press during clipboard restore starts recording immediately", "[loop][controller]")
{
    constexpr auto RestoreDelay = 1500ms;

    auto capture = LoudCapture {};
    auto transcriber = InstantTranscriber {};
    auto postProcessor = UnusedPostProcessor {};
    auto runner = SucceedingRunner {};
    auto injector = ClipboardPasteInjector(
        runner,
        OutputBackend::X11,
        PasteOptions { .restoreClipboard = true, .pasteDelay = 0ms, .restoreDelay = RestoreDelay });
    auto feedback = Collector<FeedbackKind> {};
    auto sink = CallbackFeedback([&](const FeedbackEvent& event) { feedback.add(event.kind); });

    auto loop = PipelineLoop {};
    auto executor = ThreadExecutor {};
    auto controller =
        PipelineController(capture, transcriber, postProcessor, injector, sink, loop, executor, PipelineSettings {});
    loop.start([&](PipelineEvent event) { controller.handle(std::move(event)); });

    loop.post(hotkey(HotkeyEvent::Kind::Press));
    loop.post(hotkey(HotkeyEvent::Kind::Release));

    // Save, write and paste are done; the injector now sleeps before restoring
    REQUIRE(runner.commandLines.waitFor(3).size() == 3);

    auto const pressed = std::chrono::steady_clock::now();
    loop.post(hotkey(HotkeyEvent::Kind::Press));
    auto const starts = capture.starts.waitFor(2, 1000ms);
    auto const waited = std::chrono::steady_clock::now() - pressed;

    CHECK(starts.size() == 2);
    CHECK(waited < RestoreDelay);
    CHECK(runner.commandLines.waitFor(4, 0ms).size() == 3);

    loop.stop();
}

// }}}
