#include <Cask/Containers/ConcurrentMapOptions.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace Cask::Containers
{
    namespace
    {
        constexpr UIntSize kMinimumBins = 2;

        template<class T>
        bool ParseWhole(std::string_view text, T& out) noexcept
        {
            const char* first = text.data();
            const char* last  = text.data() + text.size();
            if (first == last || *first == '+' || *first == '-')
                return false;
            const auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc {} && ptr == last;
        }
    }// namespace

    MapExpected<void> ValidateOptions(const ConcurrentMapOptions& options) noexcept
    {
        if (options.initialCapacity == 0 || options.initialCapacity > ConcurrentMapOptions::kMaximumCapacity)
            return std::unexpected(MakeMapError(MapErrc::InvalidCapacity));
        if (!std::isfinite(options.loadFactor) || options.loadFactor <= 0.0)
            return std::unexpected(MakeMapError(MapErrc::InvalidLoadFactor));
        return {};
    }

    MapExpected<ConcurrentMapOptions> ParseOptions(std::string_view initialCapacity, std::string_view loadFactor) noexcept
    {
        ConcurrentMapOptions options {};
        if (!initialCapacity.empty() && !ParseWhole(initialCapacity, options.initialCapacity))
            return std::unexpected(MakeMapError(MapErrc::InvalidCapacity));
        if (!loadFactor.empty() && !ParseWhole(loadFactor, options.loadFactor))
            return std::unexpected(MakeMapError(MapErrc::InvalidLoadFactor));
        if (auto valid = ValidateOptions(options); !valid)
            return std::unexpected(valid.error());
        return options;
    }

    UIntSize TableSizeFor(UIntSize initialCapacity, F64 loadFactor) noexcept
    {
        const F64 wanted = 1.0 + static_cast<F64>(initialCapacity) / loadFactor;
        if (!(wanted < static_cast<F64>(ConcurrentMapOptions::kMaximumCapacity)))
            return ConcurrentMapOptions::kMaximumCapacity;
        const auto bins = static_cast<UIntSize>(wanted);
        return std::bit_ceil(std::max(bins, kMinimumBins));
    }

    UIntSize ResizeThresholdFor(UIntSize binCount, F64 loadFactor) noexcept
    {
        const F64 raw = static_cast<F64>(binCount) * loadFactor;
        if (!(raw < static_cast<F64>(std::numeric_limits<UIntSize>::max())))
            return std::numeric_limits<UIntSize>::max();
        return std::max<UIntSize>(1, static_cast<UIntSize>(raw));
    }
}// namespace Cask::Containers
