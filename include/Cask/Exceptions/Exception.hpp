#pragma once

#include <stdexcept>
#include <string>

namespace Cask::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in Cask.
    ///
    /// @details
    /// `Exception` is the base class for every error Cask raises itself. Errors thrown by user
    /// callbacks are never wrapped in it; they reach the caller unchanged.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message) : std::runtime_error(message) {}

        /// @brief Constructor with a std::string message.
        explicit Exception(const std::string& message) : std::runtime_error(message) {}

        /// @brief Destructor.
        ~Exception() noexcept override = default;
    };
}// namespace Cask::Exceptions
