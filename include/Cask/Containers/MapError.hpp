/// @file MapError.hpp
/// @brief Error codes and expected type for concurrent map configuration and contract violations.
#pragma once

#include <expected>
#include <system_error>

#include <Cask/Defines.hpp>
#include <Cask/Primitives.hpp>

namespace Cask::Containers
{
    enum class MapErrc : Cask::UInt8
    {
        Ok,
        InvalidCapacity,
        InvalidLoadFactor,
        Reentrancy,
    };

    /// @brief Structured map error. Carried by InvalidConfigurationException and ReentrancyException.
    struct MapError final
    {
        MapErrc code {MapErrc::Ok};

        [[nodiscard]] constexpr bool IsOk() const noexcept { return code == MapErrc::Ok; }

        friend constexpr bool operator==(const MapError&, const MapError&) noexcept = default;
    };

    [[nodiscard]] constexpr MapError MakeMapError(MapErrc code) noexcept
    {
        return MapError {code};
    }

    /// @brief Human readable description of @p code. Never returns null.
    [[nodiscard]] CASK_BASE_API const char* ToString(MapErrc code) noexcept;

    [[nodiscard]] inline std::error_code ToErrorCode(MapError error) noexcept
    {
        switch (error.code)
        {
            case MapErrc::InvalidCapacity: return std::make_error_code(std::errc::invalid_argument);
            case MapErrc::InvalidLoadFactor: return std::make_error_code(std::errc::invalid_argument);
            case MapErrc::Reentrancy: return std::make_error_code(std::errc::resource_deadlock_would_occur);
            case MapErrc::Ok: break;
        }
        return {};
    }

    template<typename T>
    using MapExpected = std::expected<T, MapError>;
}// namespace Cask::Containers
