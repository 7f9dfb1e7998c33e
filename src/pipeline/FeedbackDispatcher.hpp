// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/FeedbackSink.hpp>

#include <memory>

namespace pushscribe
{

/// @brief Asynchronous fan-out of feedback notifications.
///
/// notify() only enqueues, so the caller never blocks on a slow sink. A worker
/// thread delivers every event, in order, to each registered sink.
class FeedbackDispatcher: public FeedbackSink
{
  public:
    FeedbackDispatcher();
    ~FeedbackDispatcher() override;

    FeedbackDispatcher(const FeedbackDispatcher&) = delete;
    FeedbackDispatcher& operator=(const FeedbackDispatcher&) = delete;

    /// @brief Registers a sink. The sink must outlive the dispatcher or shutdown().
    void addSink(FeedbackSink& sink);

    void notify(const FeedbackEvent& event) override;

    /// @brief Blocks until every event enqueued so far has been delivered.
    void flush();

    /// @brief Delivers the remaining events and stops the worker thread.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
