// SPDX-License-Identifier: Apache-2.0
#include "ThreadExecutor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pushscribe
{

struct ThreadExecutor::Impl
{
    struct Worker
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mutex;
    std::vector<Worker> workers;

    void reapFinished()
    {
        std::erase_if(workers, [](Worker& worker) {
            if (!worker.done->load(std::memory_order_acquire))
                return false;
            worker.thread.join();
            return true;
        });
    }
};

ThreadExecutor::ThreadExecutor(): _impl(std::make_unique<Impl>())
{
}

ThreadExecutor::~ThreadExecutor()
{
    auto workers = std::vector<Impl::Worker> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        workers.swap(_impl->workers);
    }
    // jthread joins on destruction
    workers.clear();
}

void ThreadExecutor::execute(std::function<void()> task)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->reapFinished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([task = std::move(task), done] {
        log::setThreadName("worker");
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            log::error("Background task failed: {}", e.what());
        }
        done->store(true, std::memory_order_release);
    });
    _impl->workers.push_back(Impl::Worker { .thread = std::move(thread), .done = std::move(done) });
}

auto ThreadExecutor::activeCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return static_cast<std::size_t>(std::ranges::count_if(
        _impl->workers, [](const Impl::Worker& worker) { return !worker.done->load(std::memory_order_acquire); }));
}

} // namespace pushscribe
