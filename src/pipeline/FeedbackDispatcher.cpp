// SPDX-License-Identifier: Apache-2.0
#include "FeedbackDispatcher.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace pushscribe
{

struct FeedbackDispatcher::Impl
{
    std::jthread worker;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<FeedbackEvent> queue;
    std::vector<FeedbackSink*> sinks;
    std::uint64_t enqueued = 0;
    std::uint64_t delivered = 0;
    bool shutdownRequested = false;

    void run()
    {
        while (true)
        {
            auto event = FeedbackEvent {};
            auto targets = std::vector<FeedbackSink*> {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, [this] { return !queue.empty() || shutdownRequested; });

                // Pending events are still delivered on shutdown
                if (queue.empty())
                    return;

                event = std::move(queue.front());
                queue.pop_front();
                targets = sinks;
            }

            for (auto* sink: targets)
                sink->notify(event);

            {
                auto lock = std::lock_guard(mutex);
                ++delivered;
            }
            cv.notify_all();
        }
    }
};

FeedbackDispatcher::FeedbackDispatcher(): _impl(std::make_unique<Impl>())
{
    _impl->worker = std::jthread([impl = _impl.get()] {
        log::setThreadName("feedback");
        impl->run();
    });
}

FeedbackDispatcher::~FeedbackDispatcher()
{
    shutdown();
}

void FeedbackDispatcher::addSink(FeedbackSink& sink)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->sinks.push_back(&sink);
}

void FeedbackDispatcher::notify(const FeedbackEvent& event)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->queue.push_back(event);
        ++_impl->enqueued;
    }
    _impl->cv.notify_all();
}

void FeedbackDispatcher::flush()
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const target = _impl->enqueued;
    _impl->cv.wait(lock, [&] { return _impl->delivered >= target; });
}

void FeedbackDispatcher::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
    }
    _impl->cv.notify_all();
    if (_impl->worker.joinable())
        _impl->worker.join();
}

} // namespace pushscribe
