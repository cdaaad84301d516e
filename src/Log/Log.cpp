#include <Spindle/Log/Log.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace Spindle::Log
{
    namespace
    {
        constexpr Level DEFAULT_LEVEL = Level::Warning;

        std::atomic<Level>& Threshold() noexcept
        {
            static std::atomic<Level> threshold {[]() noexcept {
                const char* text = std::getenv("SPINDLE_LOG_LEVEL");
                if (text == nullptr)
                {
                    return DEFAULT_LEVEL;
                }
                return ParseLevel(text).value_or(DEFAULT_LEVEL);
            }()};
            return threshold;
        }

        bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (UIntSize i = 0; i < a.size(); ++i)
            {
                const char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
                if (ca != b[i])
                {
                    return false;
                }
            }
            return true;
        }
    }// namespace

    Level GetLevel() noexcept
    {
        return Threshold().load(std::memory_order_relaxed);
    }

    void SetLevel(Level level) noexcept
    {
        Threshold().store(level, std::memory_order_relaxed);
    }

    std::optional<Level> ParseLevel(std::string_view text) noexcept
    {
        if (EqualsIgnoreCase(text, "trace"))
            return Level::Trace;
        if (EqualsIgnoreCase(text, "debug"))
            return Level::Debug;
        if (EqualsIgnoreCase(text, "info"))
            return Level::Info;
        if (EqualsIgnoreCase(text, "warning") || EqualsIgnoreCase(text, "warn"))
            return Level::Warning;
        if (EqualsIgnoreCase(text, "error"))
            return Level::Error;
        if (EqualsIgnoreCase(text, "off"))
            return Level::Off;
        return std::nullopt;
    }

    std::string_view ToString(Level level) noexcept
    {
        switch (level)
        {
            case Level::Trace:
                return "trace";
            case Level::Debug:
                return "debug";
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
            case Level::Off:
                return "off";
        }
        return "unknown";
    }

    void Write(Level level, std::string_view channel, std::string_view message)
    {
        fmt::print(stderr, "[spindle:{}] {}: {}\n", channel, ToString(level), message);
    }
}// namespace Spindle::Log
