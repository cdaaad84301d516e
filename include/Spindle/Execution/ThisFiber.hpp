/// @file ThisFiber.hpp
/// @brief Calling-fiber utilities for stackful fibers.
#pragma once

#include <Spindle/Execution/Fiber.hpp>

namespace Spindle::Execution::ThisFiber
{
    /// @brief True only when the calling thread is currently executing inside a running fiber.
    [[nodiscard]] inline bool IsInFiber() noexcept
    {
        return Spindle::Execution::Fiber::IsInFiber();
    }

    inline void YieldNow()
    {
        Spindle::Execution::Fiber::YieldNow();
    }

    inline void YieldTo(Spindle::Execution::Fiber& target)
    {
        Spindle::Execution::Fiber::YieldTo(target);
    }
}// namespace Spindle::Execution::ThisFiber
