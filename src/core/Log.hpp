// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pushscribe::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every emitted log message, already filtered by level.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes log messages to @p callback instead of stderr.
///
/// Pass an empty callback to revert to stderr output.
/// The callback may be invoked from any thread, but never concurrently.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @return The level, or std::nullopt if the name is unknown.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Returns the lower-case name of a level.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Names the calling thread in subsequent log lines ("loop", "worker", ...).
void setThreadName(std::string_view name);

/// @brief Formats a message the way it is written to stderr:
/// "HH:MM:SS.mmm [LEVEL] (thread) message".
[[nodiscard]] auto formatLine(Level level, std::string_view message) -> std::string;

/// @brief Emits a message, to the callback if one is installed or to stderr otherwise.
///
/// Messages above the current level are dropped. Thread safe; lines are never interleaved.
void write(Level level, std::string_view message);

[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Formats and emits a message if @p level is enabled.
template <typename... Args>
void print(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    log::print(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    log::print(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    log::print(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    log::print(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    log::print(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace pushscribe::log
