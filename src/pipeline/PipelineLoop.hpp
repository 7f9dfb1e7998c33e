// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/PipelineEvent.hpp>

#include <functional>
#include <memory>

namespace pushscribe
{

/// @brief The single event loop thread of the pipeline.
///
/// Events are handled strictly one at a time, in posting order. Delayed events
/// join the queue when their deadline passes.
class PipelineLoop: public Scheduler
{
  public:
    using Handler = std::function<void(PipelineEvent event)>;

    PipelineLoop();
    ~PipelineLoop() override;

    PipelineLoop(const PipelineLoop&) = delete;
    PipelineLoop& operator=(const PipelineLoop&) = delete;

    /// @brief Starts the loop thread, which calls @p handler for every event.
    void start(Handler handler);

    /// @brief Stops the loop thread. Queued and pending delayed events are dropped.
    void stop();

    void post(PipelineEvent event) override;
    void postAfter(std::chrono::milliseconds delay, PipelineEvent event) override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
