/// @file Log.hpp
/// @brief Leveled diagnostic logging to stderr, formatted with {fmt}.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Primitives.hpp>

#include <fmt/core.h>

#include <optional>
#include <string_view>
#include <utility>

namespace Spindle::Log
{
    enum class Level : UInt8
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Off,
    };

    /// @brief Current threshold. Initialized from the SPINDLE_LOG_LEVEL environment variable on first use,
    /// `Warning` when unset or unparsable.
    [[nodiscard]] SPINDLE_BASE_API Level GetLevel() noexcept;
    SPINDLE_BASE_API void                SetLevel(Level level) noexcept;

    [[nodiscard]] SPINDLE_BASE_API std::optional<Level> ParseLevel(std::string_view text) noexcept;
    [[nodiscard]] SPINDLE_BASE_API std::string_view     ToString(Level level) noexcept;

    [[nodiscard]] inline bool IsEnabled(Level level) noexcept
    {
        return level != Level::Off && level >= GetLevel();
    }

    /// @brief Writes one line `[spindle:<channel>] <level>: <message>` regardless of the threshold.
    SPINDLE_BASE_API void Write(Level level, std::string_view channel, std::string_view message);

    template<class... Args>
    void Print(Level level, std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        if (!IsEnabled(level))
        {
            return;
        }
        Write(level, channel, fmt::format(format, std::forward<Args>(args)...));
    }

    template<class... Args>
    void Trace(std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        Print(Level::Trace, channel, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    void Debug(std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        Print(Level::Debug, channel, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    void Info(std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        Print(Level::Info, channel, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    void Warning(std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        Print(Level::Warning, channel, format, std::forward<Args>(args)...);
    }

    template<class... Args>
    void Error(std::string_view channel, fmt::format_string<Args...> format, Args&&... args)
    {
        Print(Level::Error, channel, format, std::forward<Args>(args)...);
    }
}// namespace Spindle::Log
