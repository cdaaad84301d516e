/// @file Log.cpp
/// @brief Tests for Spindle::Log.

#include <Spindle/Log/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

using namespace Spindle::Log;

namespace
{
    struct FormatCounter
    {
        mutable int formatted {0};
    };
}// namespace

template<>
struct fmt::formatter<FormatCounter> : fmt::formatter<int>
{
    auto format(const FormatCounter& counted, fmt::format_context& ctx) const
    {
        ++counted.formatted;
        return fmt::formatter<int>::format(counted.formatted, ctx);
    }
};

TEST_CASE("ParseLevel accepts level names in any case", "[Log]")
{
    CHECK(ParseLevel("trace") == Level::Trace);
    CHECK(ParseLevel("DEBUG") == Level::Debug);
    CHECK(ParseLevel("Info") == Level::Info);
    CHECK(ParseLevel("warn") == Level::Warning);
    CHECK(ParseLevel("warning") == Level::Warning);
    CHECK(ParseLevel("error") == Level::Error);
    CHECK(ParseLevel("off") == Level::Off);
    CHECK_FALSE(ParseLevel("verbose").has_value());
    CHECK_FALSE(ParseLevel("").has_value());
}

TEST_CASE("ToString names every level", "[Log]")
{
    CHECK(ToString(Level::Trace) == "trace");
    CHECK(ToString(Level::Warning) == "warning");
    CHECK(ToString(Level::Off) == "off");
    CHECK(ParseLevel(ToString(Level::Error)) == Level::Error);
}

TEST_CASE("SetLevel controls IsEnabled", "[Log]")
{
    const auto previous = GetLevel();

    SetLevel(Level::Warning);
    CHECK_FALSE(IsEnabled(Level::Debug));
    CHECK(IsEnabled(Level::Warning));
    CHECK(IsEnabled(Level::Error));

    SetLevel(Level::Trace);
    CHECK(IsEnabled(Level::Trace));

    SetLevel(Level::Off);
    CHECK_FALSE(IsEnabled(Level::Error));
    CHECK_FALSE(IsEnabled(Level::Off));

    SetLevel(previous);
}

TEST_CASE("Disabled messages are not formatted", "[Log]")
{
    const auto previous = GetLevel();
    SetLevel(Level::Error);

    FormatCounter counted;
    Debug("test", "value {}", counted);
    Warning("test", "value {}", counted);
    CHECK(counted.formatted == 0);

    SetLevel(Level::Warning);
    Warning("test", "value {}", counted);
    CHECK(counted.formatted == 1);

    SetLevel(previous);
}
