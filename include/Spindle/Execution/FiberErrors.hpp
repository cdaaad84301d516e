/// @file FiberErrors.hpp
/// @brief Exception types raised by the fiber layer.
#pragma once

#include <Spindle/Exceptions/Exception.hpp>
#include <Spindle/Primitives.hpp>

#include <string>

namespace Spindle::Execution
{
    /// @brief Base class for errors reported by fibers, stacks and the fiber pool.
    class FiberError : public Exceptions::Exception
    {
    public:
        using Exceptions::Exception::Exception;
    };

    /// @brief Stack or fiber bookkeeping memory could not be obtained.
    ///
    /// @details
    /// Recoverable: nothing was started and no state changed. `ErrorCode` holds the `errno` value
    /// when the failure came from the operating system (mmap/mprotect), otherwise 0.
    class AllocationError final : public FiberError
    {
    public:
        AllocationError(const std::string& message, UIntSize requestedSize, int errorCode = 0)
            : FiberError(message)
            , m_requestedSize(requestedSize)
            , m_errorCode(errorCode)
        {
        }

        [[nodiscard]] UIntSize RequestedSize() const noexcept { return m_requestedSize; }
        [[nodiscard]] int      ErrorCode() const noexcept { return m_errorCode; }

    private:
        UIntSize m_requestedSize {0};
        int      m_errorCode {0};
    };

    /// @brief A fiber was resumed while it already holds control, or while it waits inside a nested resume.
    class ReentrancyError final : public FiberError
    {
    public:
        using FiberError::FiberError;
    };

    /// @brief An operation was applied to a fiber in a state that does not allow it.
    class InvalidFiberError final : public FiberError
    {
    public:
        using FiberError::FiberError;
    };
}// namespace Spindle::Execution
