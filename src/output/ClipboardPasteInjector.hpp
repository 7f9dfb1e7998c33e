// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <output/CommandRunner.hpp>
#include <output/OutputInjector.hpp>

#include <chrono>
#include <mutex>

namespace pushscribe
{

struct PasteOptions
{
    bool restoreClipboard = true;
    std::chrono::milliseconds pasteDelay { 50 };   ///< Between writing the clipboard and the paste keystroke.
    std::chrono::milliseconds restoreDelay { 150 }; ///< Between the paste keystroke and restoring the clipboard.
};

/// @brief Delivers text by swapping it into the clipboard and sending Ctrl+V.
///
/// The previous clipboard text is saved first and written back after the
/// paste. If the paste keystroke fails, the text is left on the clipboard so
/// the user can paste it manually.
class ClipboardPasteInjector: public OutputInjector
{
  public:
    /// @param backend A concrete backend (not Auto).
    ClipboardPasteInjector(CommandRunner& runner, OutputBackend backend, PasteOptions options);

    [[nodiscard]] auto deliver(const std::string& text) -> VoidResult override;

  private:
    [[nodiscard]] auto readClipboard() -> std::optional<std::string>;
    [[nodiscard]] auto writeClipboard(const std::string& text) -> VoidResult;
    [[nodiscard]] auto sendPaste() -> VoidResult;

    CommandRunner& _runner;
    OutputBackend _backend;
    PasteOptions _options;
    std::mutex _mutex; // one clipboard swap at a time
};

} // namespace pushscribe
