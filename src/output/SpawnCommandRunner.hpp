// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <output/CommandRunner.hpp>

namespace pushscribe
{

/// @brief CommandRunner that spawns child processes with posix_spawnp and pipes.
///
/// A child that outlives its timeout is killed.
class SpawnCommandRunner: public CommandRunner
{
  public:
    [[nodiscard]] auto run(const Command& command) -> Result<CommandOutput> override;
};

} // namespace pushscribe
