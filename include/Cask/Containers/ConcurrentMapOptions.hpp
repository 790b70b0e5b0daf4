/// @file ConcurrentMapOptions.hpp
/// @brief Construction-time configuration for ConcurrentMap.
#pragma once

#include <string_view>

#include <Cask/Containers/MapError.hpp>
#include <Cask/Defines.hpp>
#include <Cask/Primitives.hpp>

namespace Cask::Containers
{
    struct ConcurrentMapOptions
    {
        static constexpr UIntSize kDefaultInitialCapacity = 16;
        static constexpr F64      kDefaultLoadFactor      = 0.75;
        /// @brief Largest bin count a table may reach.
        static constexpr UIntSize kMaximumCapacity = UIntSize {1} << 30;

        /// @brief Number of entries the map should hold before its first resize.
        UIntSize initialCapacity {kDefaultInitialCapacity};
        /// @brief Entries-per-bin ratio above which the table doubles.
        F64 loadFactor {kDefaultLoadFactor};
    };

    /// @brief Checks @p options without constructing anything.
    /// @return InvalidCapacity for a zero or oversized capacity, InvalidLoadFactor for a
    ///         non-finite or non-positive load factor.
    [[nodiscard]] CASK_BASE_API MapExpected<void> ValidateOptions(const ConcurrentMapOptions& options) noexcept;

    /// @brief Builds options from textual values as handed over by an embedding layer.
    ///
    /// An empty view means the option was not supplied and selects the default. Anything that is
    /// not a complete positive number is rejected with the matching error code.
    [[nodiscard]] CASK_BASE_API MapExpected<ConcurrentMapOptions> ParseOptions(std::string_view initialCapacity,
                                                                               std::string_view loadFactor) noexcept;

    /// @brief Bin count for a table meant to hold @p initialCapacity entries at @p loadFactor.
    /// @pre ValidateOptions succeeded for the pair.
    [[nodiscard]] CASK_BASE_API UIntSize TableSizeFor(UIntSize initialCapacity, F64 loadFactor) noexcept;

    /// @brief Entry count above which a table of @p binCount bins resizes. Always at least 1.
    [[nodiscard]] CASK_BASE_API UIntSize ResizeThresholdFor(UIntSize binCount, F64 loadFactor) noexcept;
}// namespace Cask::Containers
