// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/PipelineEvent.hpp>

#include <memory>

namespace pushscribe
{

/// @brief TaskExecutor running every task on its own thread.
///
/// Remote calls of a superseded run may still be finishing while the next
/// run's call starts, so tasks never wait for each other. Finished threads are
/// reaped on the next execute(); the destructor joins the rest.
class ThreadExecutor: public TaskExecutor
{
  public:
    ThreadExecutor();
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void execute(std::function<void()> task) override;

    /// @brief Returns the number of tasks that have not finished yet.
    [[nodiscard]] auto activeCount() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
