// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <output/CommandRunner.hpp>
#include <output/OutputInjector.hpp>

#include <mutex>

namespace pushscribe
{

/// @brief Delivers text by synthesizing key presses for every character.
///
/// Slower than pasting, but leaves the clipboard untouched.
class TypeTextInjector: public OutputInjector
{
  public:
    /// @param backend A concrete backend (not Auto).
    TypeTextInjector(CommandRunner& runner, OutputBackend backend);

    [[nodiscard]] auto deliver(const std::string& text) -> VoidResult override;

  private:
    CommandRunner& _runner;
    OutputBackend _backend;
    std::mutex _mutex;
};

} // namespace pushscribe
