// SPDX-License-Identifier: Apache-2.0
#include "PipelineLoop.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace pushscribe
{

struct PipelineLoop::Impl
{
    using Clock = std::chrono::steady_clock;

    std::jthread thread;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<PipelineEvent> queue;
    std::multimap<Clock::time_point, PipelineEvent> timers;
    bool timersChanged = false;

    void promoteDueTimers()
    {
        auto const now = Clock::now();
        while (!timers.empty() && timers.begin()->first <= now)
        {
            queue.push_back(std::move(timers.begin()->second));
            timers.erase(timers.begin());
        }
    }

    void run(const std::stop_token& stopToken, const Handler& handler)
    {
        while (!stopToken.stop_requested())
        {
            auto event = PipelineEvent {};
            {
                auto lock = std::unique_lock(mutex);
                while (true)
                {
                    promoteDueTimers();
                    if (!queue.empty() || stopToken.stop_requested())
                        break;

                    auto const ready = [this] { return !queue.empty() || timersChanged; };
                    if (timers.empty())
                        cv.wait(lock, stopToken, ready);
                    else
                        cv.wait_until(lock, stopToken, timers.begin()->first, ready);
                    timersChanged = false;
                }
                if (stopToken.stop_requested())
                    return;

                event = std::move(queue.front());
                queue.pop_front();
            }
            handler(std::move(event));
        }
    }
};

PipelineLoop::PipelineLoop(): _impl(std::make_unique<Impl>())
{
}

PipelineLoop::~PipelineLoop()
{
    stop();
}

void PipelineLoop::start(Handler handler)
{
    _impl->thread = std::jthread([impl = _impl.get(), handler = std::move(handler)](std::stop_token stopToken) {
        log::setThreadName("loop");
        impl->run(stopToken, handler);
    });
}

void PipelineLoop::stop()
{
    if (!_impl->thread.joinable())
        return;
    _impl->thread.request_stop();
    _impl->thread.join();

    auto lock = std::lock_guard(_impl->mutex);
    _impl->queue.clear();
    _impl->timers.clear();
}

void PipelineLoop::post(PipelineEvent event)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->queue.push_back(std::move(event));
    }
    _impl->cv.notify_one();
}

void PipelineLoop::postAfter(std::chrono::milliseconds delay, PipelineEvent event)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->timers.emplace(Impl::Clock::now() + delay, std::move(event));
        _impl->timersChanged = true;
    }
    _impl->cv.notify_one();
}

} // namespace pushscribe
