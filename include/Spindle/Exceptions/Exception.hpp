#pragma once

#include <stdexcept>
#include <string>

namespace Spindle::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in Spindle.
    ///
    /// @details
    /// `Exception` is the base class for all exceptions thrown by Spindle. It provides a common
    /// interface for exception handling and access to the exception message.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor with a C-style string message.
        Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with a string message.
        Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        virtual ~Exception() noexcept = default;

        /// @brief Returns the exception message.
        /// @return A string containing the exception message.
        const char* GetMessage() const noexcept { return this->what(); };
    };
}// namespace Spindle::Exceptions
