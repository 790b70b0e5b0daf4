// Fundamental type definitions shared by every Cask module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace Cask
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit signed integer.
    using Int64 = std::int64_t;

    /// @brief Represents a 64-bit floating point number.
    using F64 = double;

    using UIntSize = std::size_t;
}// namespace Cask
