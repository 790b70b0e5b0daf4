#pragma once

/// @file InvalidConfigurationException.hpp
/// @brief Declares the InvalidConfigurationException class.

#include <Cask/Containers/MapError.hpp>
#include <Cask/Exceptions/Exception.hpp>

namespace Cask::Exceptions
{
    /// @class InvalidConfigurationException
    /// @brief Thrown when a container is constructed from options that fail validation.
    ///
    /// @details
    /// Construction is all-or-nothing: when this is thrown no container object exists.
    class InvalidConfigurationException : public Exception
    {
    public:
        explicit InvalidConfigurationException(Containers::MapError error)
            : Exception(Containers::ToString(error.code)), m_error(error)
        {
        }

        [[nodiscard]] Containers::MapError GetError() const noexcept { return m_error; }

    private:
        Containers::MapError m_error;
    };
}// namespace Cask::Exceptions
