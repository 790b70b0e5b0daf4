#pragma once

/// @file ReentrancyException.hpp
/// @brief Declares the ReentrancyException class.

#include <Cask/Containers/MapError.hpp>
#include <Cask/Exceptions/Exception.hpp>

namespace Cask::Exceptions
{
    /// @class ReentrancyException
    /// @brief Thrown when a callback running under a bucket lock calls back into the same bucket.
    ///
    /// @details
    /// Raised before the nested call blocks, so the outer operation can unwind normally. The outer
    /// compound operation sees it as a callback failure and commits nothing.
    class ReentrancyException : public Exception
    {
    public:
        ReentrancyException()
            : Exception(Containers::ToString(Containers::MapErrc::Reentrancy))
        {
        }

        [[nodiscard]] Containers::MapError GetError() const noexcept
        {
            return Containers::MakeMapError(Containers::MapErrc::Reentrancy);
        }
    };
}// namespace Cask::Exceptions
